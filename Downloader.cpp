#include "downloader.h"

//curl_global_init() for the lifetime of one invocation
class CurlGlobal{
    public:
        CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_ALL)) {}
        ~CurlGlobal(){
            if(rc == CURLE_OK){
                curl_global_cleanup();
            }
        }
        CURLcode rc;
};

//HTTP/HTTPS link: probe, pick the file name, then segmented or single-connection download
int download_http(const string& url, const string& dir, const Config& cfg){
    print_info("Starting download...");
    print_info("Input: " + url);
    print_info("Download directory: " + dir);

    RemoteInfo info;
    if(probe_remote(url, cfg, info) != 0){
        return EXIT_CODE_DOWNLOAD;
    }

    string name = info.filename.empty() ? filename_from_url(info.effective_url) : info.filename;
    string outpath = join_path(dir, name);
    string control = outpath + CONTROL_SUFFIX;

    if(file_exists(control) && is_own_control_file(control)){
        ControlState st;
        bool same_url = load_control_file(control, st) == 0 &&
                        (st.url == url || st.url == info.effective_url);
        if(same_url && file_exists(outpath)){
            print_info("Found unfinished download, continuing: " + name);
            return resume_big_file(outpath, cfg);
        }
        if(!file_exists(outpath)){
            //nothing left to continue, the sidecar is stale
            unlink(control.c_str());
        }
    }
    if(file_exists(outpath)){
        outpath = unique_path(outpath);
        print_info("File exists, saving as: " + outpath);
    }

    int rc;
    if(info.size > 0 && info.accept_ranges){
        rc = download_big_file(url, info, outpath, cfg);
    }else{
        rc = download_stream(url, outpath, cfg);
    }
    if(rc == EXIT_CODE_OK){
        print_success("Download completed successfully: " + outpath);
    }
    return rc;
}

// Resume download function
int resume_download(const string& file, const string& dir, const Config& cfg){
    string full_path = join_path(dir, file);
    string control_file = full_path + CONTROL_SUFFIX;

    if(!file_exists(control_file)){
        print_error("Control file not found: " + control_file);
        print_error("Cannot resume download without control file");
        return EXIT_CODE_INPUT;
    }
    if(!is_own_control_file(control_file)){
        print_error("Failed to resume download");
        print_info("Control file may be corrupted or incompatible");
        return EXIT_CODE_DOWNLOAD;
    }

    print_info("Resuming download: " + file);
    int rc = resume_big_file(full_path, cfg);
    if(rc == EXIT_CODE_OK){
        print_success("Download resumed and completed successfully!");
    }
    return rc;
}

int txdl_main(int argc, char* argv[]){
    Options opt = parse_options(argc, argv);
    if(opt.help){
        show_help();
        return EXIT_CODE_OK;
    }
    if(!opt.error.empty()){
        print_error(opt.error);
        show_help();
        return EXIT_CODE_INPUT;
    }

    Config cfg;
    if(load_config(cfg) != 0){
        return EXIT_CODE_INPUT;
    }

    string download_dir = expand_home(opt.download_dir.empty() ? default_download_dir() : opt.download_dir);

    //check permissions and disk space
    int rc = check_permissions(download_dir);
    if(rc != EXIT_CODE_OK){
        return rc;
    }
    rc = check_disk_space(download_dir, cfg.min_free_mb);
    if(rc != EXIT_CODE_OK){
        return rc;
    }

    CurlGlobal curl;
    if(curl.rc != CURLE_OK){
        print_error("curl_global_init failed!");
        return EXIT_CODE_DOWNLOAD;
    }

    if(!opt.resume_file.empty()){
        rc = resume_download(opt.resume_file, download_dir, cfg);
    }else if(opt.use_recent_torrent){
        string torrent_file;
        rc = find_recent_torrent(download_dir, torrent_file);
        if(rc == EXIT_CODE_OK){
            print_info("Using torrent file: " + torrent_file);
            rc = download_with_aria2(torrent_file, download_dir, cfg);
        }
    }else{
        switch(classify_input(opt.link)){
            case INPUT_HTTP:
                rc = download_http(opt.link, download_dir, cfg);
                break;
            case INPUT_MAGNET:
            case INPUT_TORRENT:
                rc = download_with_aria2(opt.link, download_dir, cfg);
                break;
            default:
                print_error("Invalid URL or file: " + opt.link);
                rc = EXIT_CODE_INPUT;
                break;
        }
    }

    if(rc == EXIT_CODE_OK){
        print_success("Operation completed successfully!");
    }
    return rc;
}
