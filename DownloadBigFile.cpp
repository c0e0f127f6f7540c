#include "downloader.h"

#include <atomic>
#include <cerrno>

//split [0, total_size) into contiguous inclusive ranges, the last one takes the remainder
vector<Chunk> plan_segments(curl_off_t total_size, const Config& cfg){
    vector<Chunk> chunks;
    if(total_size <= 0){
        return chunks;
    }

    curl_off_t num = cfg.max_connections < MAX_SPLIT ? cfg.max_connections : MAX_SPLIT;
    curl_off_t by_size = cfg.min_split_size > 0 ? total_size / cfg.min_split_size : total_size;
    if(num > by_size){
        num = by_size;
    }
    //cap segments to not exceed bytes
    if(num > total_size){
        num = total_size;
    }
    if(num <= 0){
        num = 1;
    }

    const curl_off_t chunk_size = total_size / num;
    const curl_off_t remainder = total_size % num;
    curl_off_t offset = 0;
    chunks.reserve(static_cast<size_t>(num));
    for(curl_off_t i = 0; i < num; ++i){
        curl_off_t this_size = chunk_size + ((i == num - 1) ? remainder : 0);
        chunks.emplace_back();
        Chunk& chunk = chunks.back();
        chunk.id = static_cast<int>(i) + 1;
        chunk.start = offset;
        chunk.current = offset;
        chunk.end = offset + this_size - 1;
        offset += this_size;
    }
    return chunks;
}

// Thread function: download one range, retrying from the current offset
void download_one_chunk(Chunk& c, const Config& cfg){
    for(int attempt = 1; attempt <= cfg.max_tries; ++attempt){
        if(c.done()){
            c.result = 0;
            return;
        }
        if(g_interrupted){
            return;
        }

        CURL* handle = curl_easy_init();
        if(!handle){
            print_error("curl_easy_init failed for segment " + to_string(c.id));
            return;
        }

        curl_off_t from;
        {
            lock_guard<mutex> lock(c.prog->mtx);
            from = c.current;
        }
        // set the range
        string range = to_string(from) + "-" + to_string(c.end);
        c.handle = handle;
        c.checked_status = false;
        c.error.clear();
        c.errbuf[0] = '\0';

        curl_easy_setopt(handle, CURLOPT_URL, c.url.c_str());
        curl_easy_setopt(handle, CURLOPT_RANGE, range.c_str());
        //write callback
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &c);
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, abort_callback);
        curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, c.errbuf);
        apply_common_options(handle, cfg);

        CURLcode rc = curl_easy_perform(handle);
        curl_easy_cleanup(handle);
        c.handle = nullptr;

        //write_callback stops the transfer itself once the range is complete
        if(c.done()){
            c.result = 0;
            return;
        }
        if(g_interrupted){
            return;
        }

        string err;
        if(!c.error.empty()){
            err = c.error;
        }else if(rc != CURLE_OK){
            err = c.errbuf[0] ? c.errbuf : curl_easy_strerror(rc);
        }else{
            err = "connection closed before the segment was complete";
        }
        ostringstream os;
        os << "Segment " << c.id << " failed (attempt " << attempt << "/" << cfg.max_tries << "): " << err;
        print_warning(os.str());

        if(attempt < cfg.max_tries && !sleep_interruptible(cfg.retry_wait)){
            return;
        }
    }
}

//offsets are copied under the progress lock, the file is written after releasing it
static int save_snapshot(const string& control, const ControlState& st, Progress& prog){
    ControlState snap;
    snap.url = st.url;
    snap.total_size = st.total_size;
    snap.etag = st.etag;
    snap.last_modified = st.last_modified;
    snap.min_split_size = st.min_split_size;
    snap.connections = st.connections;
    snap.segments.resize(st.segments.size());
    {
        lock_guard<mutex> lock(prog.mtx);
        for(size_t i = 0; i < st.segments.size(); ++i){
            snap.segments[i].start = st.segments[i].start;
            snap.segments[i].current = st.segments[i].current;
            snap.segments[i].end = st.segments[i].end;
        }
    }
    return save_control_file(control, snap);
}

//runs every unfinished segment of st into outpath, persisting progress in outpath.aria2
//return 0 on success, EXIT_CODE_STORAGE, EXIT_CODE_DOWNLOAD or EXIT_CODE_INTERRUPTED
int run_segments(ControlState& st, const string& outpath, const Config& cfg){
    const string control = outpath + CONTROL_SUFFIX;

    curl_off_t remaining = 0;
    curl_off_t already = 0;
    for(const auto& c : st.segments){
        remaining += c.end - c.current + 1;
        already += c.current - c.start;
    }
    const curl_off_t mib = 1024 * 1024;
    long available = available_space_mb(parent_dir(outpath));
    if(available >= 0 && remaining > static_cast<curl_off_t>(available) * mib){
        ostringstream os;
        os << "Insufficient disk space for " << outpath << ": "
           << (remaining + mib - 1) / mib << "MB needed, " << available << "MB available";
        print_error(os.str());
        return EXIT_CODE_STORAGE;
    }

    //open the output file once and resize it
    int fd = open(outpath.c_str(), O_CREAT | O_RDWR, 0666);
    if(fd < 0){
        perror("open failed");
        return EXIT_CODE_STORAGE;
    }
    //pre-allocate file on disk
    if(ftruncate(fd, st.total_size) != 0){
        perror("ftruncate failed.");
        close(fd);
        return EXIT_CODE_STORAGE;
    }

    //shared progress info
    Progress prog;
    prog.total_size = st.total_size;
    prog.downloaded = already;
    prog.downloaded_at_start = already;

    for(auto& c : st.segments){
        c.prog = &prog;
        c.url = st.url;
        c.fd = fd;
        c.result = c.done() ? 0 : 1;
    }
    if(save_control_file(control, st) != 0){
        close(fd);
        return EXIT_CODE_STORAGE;
    }

    vector<thread> workers;
    workers.reserve(st.segments.size());
    atomic<int> running(0);
    for(auto& c : st.segments){
        if(c.done()){
            continue;
        }
        ++running;
        workers.emplace_back([&c, &cfg, &running](){
            download_one_chunk(c, cfg);
            --running;
        });
    }

    //persist progress about once per second while the workers run
    int ticks = 0;
    while(running.load() > 0){
        this_thread::sleep_for(chrono::milliseconds(100));
        if(++ticks % 10 == 0 && save_snapshot(control, st, prog) != 0){
            print_warning("Cannot update control file: " + control);
        }
    }

    //wait for all threads
    for(auto& th : workers){
        if(th.joinable()){
            th.join();
        }
    }

    if(fsync(fd) != 0){
        perror("fsync failed");
    }
    close(fd);

    int exit_code = EXIT_CODE_OK;
    for(auto& c : st.segments){
        if(c.result != 0){
            exit_code = EXIT_CODE_DOWNLOAD;
            if(!g_interrupted){
                print_error("Segment " + to_string(c.id) + " failed to be downloaded");
            }
        }
    }

    if(exit_code == EXIT_CODE_OK){
        unlink(control.c_str());
        return EXIT_CODE_OK;
    }
    if(g_interrupted){
        if(save_control_file(control, st) != 0){
            print_error("Cannot save control file: " + control);
        }
        print_warning("Download interrupted by user");
        print_info("Resume later with: txdl -r " + outpath.substr(outpath.find_last_of('/') + 1));
        return EXIT_CODE_INTERRUPTED;
    }
    unlink(control.c_str());
    return EXIT_CODE_DOWNLOAD;
}

//main entry: download one big file with multiple connections
int download_big_file(const string& url, const RemoteInfo& info, const string& outpath, const Config& cfg){
    ControlState st;
    st.url = url;
    st.total_size = info.size;
    st.etag = info.etag;
    st.last_modified = info.last_modified;
    st.min_split_size = cfg.min_split_size;
    st.segments = plan_segments(info.size, cfg);
    st.connections = static_cast<int>(st.segments.size());

    ostringstream os;
    os << "File size: " << info.size << " bytes, " << st.connections << " connection(s)";
    print_info(os.str());

    //a stale file of the same name must not leak bytes into unfinished ranges
    if(truncate(outpath.c_str(), 0) != 0 && errno != ENOENT){
        perror("truncate failed");
        return EXIT_CODE_STORAGE;
    }
    return run_segments(st, outpath, cfg);
}

//continue outpath from outpath.aria2 after checking the remote file is unchanged
int resume_big_file(const string& outpath, const Config& cfg){
    const string control = outpath + CONTROL_SUFFIX;
    ControlState st;
    if(load_control_file(control, st) != 0){
        print_error("Failed to resume download");
        print_info("Control file may be corrupted or incompatible");
        return EXIT_CODE_DOWNLOAD;
    }

    RemoteInfo info;
    if(probe_remote(st.url, cfg, info) != 0){
        return EXIT_CODE_DOWNLOAD;
    }
    if(info.size != st.total_size){
        ostringstream os;
        os << "Remote file changed: size is " << info.size << ", control file expects " << st.total_size;
        print_error(os.str());
        return EXIT_CODE_DOWNLOAD;
    }
    if(!st.etag.empty() && !info.etag.empty() && st.etag != info.etag){
        print_error("Remote file changed: ETag differs from the control file");
        return EXIT_CODE_DOWNLOAD;
    }
    if(!st.last_modified.empty() && !info.last_modified.empty() && st.last_modified != info.last_modified){
        print_error("Remote file changed: Last-Modified differs from the control file");
        return EXIT_CODE_DOWNLOAD;
    }
    if(!info.accept_ranges){
        print_error("Server no longer accepts range requests, cannot resume");
        return EXIT_CODE_DOWNLOAD;
    }

    if(!file_exists(outpath)){
        print_warning("Partial file is missing, starting over: " + outpath);
        for(auto& c : st.segments){
            c.current = c.start;
        }
    }

    curl_off_t done_bytes = 0;
    for(const auto& c : st.segments){
        done_bytes += c.current - c.start;
    }
    ostringstream os;
    os << "Resuming at " << done_bytes << " of " << st.total_size << " bytes, "
       << st.segments.size() << " segment(s)";
    print_info(os.str());
    return run_segments(st, outpath, cfg);
}
