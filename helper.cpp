#include "downloader.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

// one lock for every line printed, workers report progress concurrently
mutex progress_mtx;
volatile sig_atomic_t g_interrupted = 0;

void print_error(const string& msg){
    lock_guard<mutex> lock(progress_mtx);
    cerr << "[ERROR] " << msg << endl;
}

void print_warning(const string& msg){
    lock_guard<mutex> lock(progress_mtx);
    cout << "[WARNING] " << msg << endl;
}

void print_info(const string& msg){
    lock_guard<mutex> lock(progress_mtx);
    cout << "[INFO] " << msg << endl;
}

void print_success(const string& msg){
    lock_guard<mutex> lock(progress_mtx);
    cout << "[SUCCESS] " << msg << endl;
}

static void on_signal(int /*sig*/){
    g_interrupted = 1;
}

// no SA_RESTART: blocking calls return EINTR so the caller can clean up
void install_signal_handlers(){
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

//returns false if interrupted while waiting
bool sleep_interruptible(int seconds){
    for(int i = 0; i < seconds * 10; ++i){
        if(g_interrupted){
            return false;
        }
        this_thread::sleep_for(chrono::milliseconds(100));
    }
    return !g_interrupted;
}

bool ends_with(const string& s, const string& suffix){
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static string lower(string s){
    for(auto& ch : s){
        ch = static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    }
    return s;
}

static string trim(const string& s){
    size_t b = 0, e = s.size();
    while(b < e && isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

InputKind classify_input(const string& input){
    string l = lower(input);
    if(l.compare(0, 7, "http://") == 0 || l.compare(0, 8, "https://") == 0){
        return INPUT_HTTP;
    }
    if(l.compare(0, 7, "magnet:") == 0){
        return INPUT_MAGNET;
    }
    struct stat st{};
    if(ends_with(input, ".torrent") && stat(input.c_str(), &st) == 0 && S_ISREG(st.st_mode)){
        return INPUT_TORRENT;
    }
    return INPUT_INVALID;
}

string url_decode(const string& s){
    string out;
    out.reserve(s.size());
    for(size_t i = 0; i < s.size(); ++i){
        if(s[i] == '%' && i + 2 < s.size() &&
           isxdigit(static_cast<unsigned char>(s[i + 1])) &&
           isxdigit(static_cast<unsigned char>(s[i + 2]))){
            out += static_cast<char>(stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        }else{
            out += s[i];
        }
    }
    return out;
}

// never let the network choose a directory
static string sanitize_name(string name){
    size_t slash = name.find_last_of("/\\");
    if(slash != string::npos){
        name = name.substr(slash + 1);
    }
    name = trim(name);
    if(name == "." || name == ".."){
        return "";
    }
    return name;
}

string filename_from_url(const string& url){
    size_t scheme = url.find("://");
    size_t path_start = url.find('/', scheme == string::npos ? 0 : scheme + 3);
    if(path_start == string::npos){
        return "index.html";
    }
    string path = url.substr(path_start);
    size_t cut = path.find_first_of("?#");
    if(cut != string::npos){
        path = path.substr(0, cut);
    }
    size_t last = path.find_last_of('/');
    string name = sanitize_name(url_decode(path.substr(last + 1)));
    return name.empty() ? "index.html" : name;
}

//accepts filename*=UTF-8''a%20b.zip, filename="a b.zip" and filename=a.zip
string filename_from_disposition(const string& header){
    string l = lower(header);
    size_t pos = l.find("filename*=");
    if(pos != string::npos){
        string v = header.substr(pos + 10);
        size_t semi = v.find(';');
        v = trim(v.substr(0, semi));
        size_t quotes = v.find("''");
        if(quotes != string::npos){
            v = v.substr(quotes + 2);
        }
        string name = sanitize_name(url_decode(v));
        if(!name.empty()){
            return name;
        }
    }
    pos = l.find("filename=");
    if(pos == string::npos){
        return "";
    }
    string v = trim(header.substr(pos + 9));
    if(!v.empty() && v[0] == '"'){
        size_t close_quote = v.find('"', 1);
        v = v.substr(1, close_quote == string::npos ? string::npos : close_quote - 1);
    }else{
        v = v.substr(0, v.find(';'));
    }
    return sanitize_name(v);
}

void apply_common_options(CURL* handle, const Config& cfg){
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 20L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, "txdl/" TXDL_VERSION);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L); // safer in multithreaded programs
    curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L); // treat HTTP errors as failures
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg.timeout));
    // stalled below 1 byte/s for the whole timeout counts as a failure
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, static_cast<long>(cfg.timeout));
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, cfg.check_certificate ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, cfg.check_certificate ? 2L : 0L);
}

// header callback of the probe, headers of every redirect hop arrive here
static size_t probe_header_callback(char* buffer, size_t size, size_t nitems, void* userdata){
    RemoteInfo* info = static_cast<RemoteInfo*>(userdata);
    size_t total = size * nitems;
    string line(buffer, total);

    if(line.compare(0, 5, "HTTP/") == 0){
        //a new response starts, forget the previous hop
        info->accept_ranges = false;
        info->etag.clear();
        info->last_modified.clear();
        info->filename.clear();
        info->size = -1;
        return total;
    }
    size_t colon = line.find(':');
    if(colon == string::npos){
        return total;
    }
    string name = lower(trim(line.substr(0, colon)));
    string value = trim(line.substr(colon + 1));
    if(name == "accept-ranges"){
        info->accept_ranges = lower(value).find("bytes") != string::npos;
    }else if(name == "etag"){
        info->etag = value;
    }else if(name == "last-modified"){
        info->last_modified = value;
    }else if(name == "content-disposition"){
        info->filename = filename_from_disposition(value);
    }else if(name == "content-length"){
        char* endp = nullptr;
        long long len = strtoll(value.c_str(), &endp, 10);
        if(endp != value.c_str() && len >= 0){
            info->size = static_cast<curl_off_t>(len);
        }
    }
    return total;
}

class RangeProbe{
    public:
        CURL* handle;
        bool partial = false;
};

// first body bytes of a "Range: 0-0" request: keep them only if the server answered 206
static size_t range_probe_callback(void* /*ptr*/, size_t size, size_t nmemb, void* userdata){
    RangeProbe* probe = static_cast<RangeProbe*>(userdata);
    long code = 0;
    curl_easy_getinfo(probe->handle, CURLINFO_RESPONSE_CODE, &code);
    if(code != 206){
        return 0; // abort, the server would send the whole body
    }
    probe->partial = true;
    return size * nmemb;
}

//some servers support ranges without announcing Accept-Ranges on HEAD
static bool probe_range_support(const string& url, const Config& cfg){
    CURL* handle = curl_easy_init();
    if(!handle){
        return false;
    }
    RangeProbe probe;
    probe.handle = handle;
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_RANGE, "0-0");
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, range_probe_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &probe);
    apply_common_options(handle, cfg);
    curl_easy_perform(handle); // a write abort is the expected outcome for 200
    curl_easy_cleanup(handle);
    return probe.partial;
}

//HEAD request: size, range support, validators and file name
//return 0 on success, non-zero on fail
int probe_remote(const string& url, const Config& cfg, RemoteInfo& info){
    CURL* handle = curl_easy_init();
    if(!handle){
        print_error("curl_easy_init failed!");
        return 1;
    }
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, probe_header_callback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &info);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errbuf);
    apply_common_options(handle, cfg);

    CURLcode rc = curl_easy_perform(handle);
    if(rc != CURLE_OK){
        const char* err = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        print_error("Cannot reach " + url + ": " + err);
        curl_easy_cleanup(handle);
        return 1;
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &info.status);
    curl_off_t length = -1;
    if(curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK && length >= 0){
        info.size = length;
    }
    char* effective = nullptr;
    curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &effective);
    info.effective_url = effective ? effective : url;
    curl_easy_cleanup(handle);

    // status 0 means a non-HTTP scheme (file://) where ranges always work
    if(info.status == 0 && info.size >= 0){
        info.accept_ranges = true;
    }
    if(!info.accept_ranges && info.size > 0){
        info.accept_ranges = probe_range_support(url, cfg);
    }
    return 0;
}

static string format_mib(curl_off_t bytes){
    ostringstream os;
    os.setf(ios::fixed);
    os.precision(1);
    os << static_cast<double>(bytes) / (1024.0 * 1024.0);
    return os.str();
}

//caller holds prog.mtx
void report_progress(Progress& prog){
    if(prog.total_size <= 0){
        return;
    }
    int percent = static_cast<int>((prog.downloaded * 100) / prog.total_size);
    if(percent > 100){
        percent = 100;
    }
    if(percent == prog.last_percent){
        return;
    }
    prog.last_percent = percent;

    double elapsed = chrono::duration<double>(chrono::steady_clock::now() - prog.started).count();
    curl_off_t fresh = prog.downloaded - prog.downloaded_at_start;
    double speed = elapsed > 0 ? fresh / elapsed : 0.0;

    ostringstream os;
    os << "Progress: " << percent << "% (" << format_mib(prog.downloaded) << "/"
       << format_mib(prog.total_size) << " MiB, "
       << format_mib(static_cast<curl_off_t>(speed)) << " MiB/s)";
    print_info(os.str());
}

// callback: libcurl calls this when it receives data for one segment
size_t write_callback(void* ptr, size_t size, size_t nmemb, void* userdata){
    Chunk *part = static_cast<Chunk*>(userdata);
    size_t total = size * nmemb;

    if(!part->checked_status){
        long code = 0;
        curl_easy_getinfo(part->handle, CURLINFO_RESPONSE_CODE, &code);
        if(code == 200 && part->current != 0){
            part->error = "server ignored the range request";
            return 0;
        }
        part->checked_status = true;
    }

    //a server may send more than the range asked for, keep only our bytes
    curl_off_t room = part->end - part->current + 1;
    size_t wanted = total;
    if(static_cast<curl_off_t>(wanted) > room){
        wanted = static_cast<size_t>(room);
    }

    //write exactly where this chunk should go
    const char* data = static_cast<const char*>(ptr);
    size_t written = 0;
    while(written < wanted){
        ssize_t n = pwrite(part->fd, data + written, wanted - written, part->current + written);
        if(n < 0){
            if(errno == EINTR){
                continue;
            }
            part->error = string("pwrite failed: ") + strerror(errno);
            return 0;
        }
        written += static_cast<size_t>(n);
    }

    //progress (thread-safe), current is read by the control file writer under the same lock
    {
        lock_guard<mutex> lock(part->prog->mtx);
        part->current += written;
        part->prog->downloaded += written;
        report_progress(*part->prog);
    }

    if(wanted < total){
        return 0; // segment complete, stop the transfer
    }
    return total; //return the number of bytes we consumed
}

//aborts a transfer once SIGINT or SIGTERM arrived
int abort_callback(void* /*clientp*/, curl_off_t, curl_off_t, curl_off_t, curl_off_t){
    return g_interrupted ? 1 : 0;
}
