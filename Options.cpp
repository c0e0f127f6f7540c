#include "downloader.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <getopt.h>

void show_help(){
    cout <<
"txdl v" TXDL_VERSION " - Download accelerator for HTTP/HTTPS, magnet links and torrents\n"
"\n"
"USAGE:\n"
"    txdl -l <URL|magnet|torrent_file> [-d <directory>]\n"
"    txdl -t [-d <directory>]\n"
"    txdl -r <file_to_resume> [-d <directory>]\n"
"    txdl -h\n"
"\n"
"OPTIONS:\n"
"    -l  Link or file (HTTP/HTTPS URL, magnet link, or .torrent file path)\n"
"    -t  Use the most recent .torrent file in the download directory\n"
"    -r  Resume an interrupted download (specify the incomplete file name)\n"
"    -d  Specify custom download directory (default: ~/Downloads)\n"
"    -h  Display this help message\n"
"\n"
"EXAMPLES:\n"
"    txdl -l https://example.com/file.zip\n"
"    txdl -l \"magnet:?xt=urn:btih:...\"\n"
"    txdl -l /path/to/file.torrent\n"
"    txdl -t\n"
"    txdl -r incomplete_file.zip\n"
"    txdl -l https://example.com/file.zip -d /sdcard/MyDownloads\n"
"\n"
"CONFIGURATION:\n"
"    ARIA2_MAX_CONNECTIONS=16         # Max connections per download\n"
"    ARIA2_MIN_SPLIT_SIZE=1M          # Minimum segment size (K, M, G suffixes)\n"
"    ARIA2_MAX_CONCURRENT_DOWNLOADS=3 # Max parallel downloads (aria2c)\n"
"    ARIA2_TIMEOUT=60                 # Connection timeout in seconds\n"
"    ARIA2_RETRY_WAIT=3               # Seconds between retries\n"
"    ARIA2_MAX_TRIES=5                # Maximum attempts per segment\n"
"    TXDL_MIN_FREE_MB=100             # Required free space in the download directory\n"
"    TXDL_CHECK_CERTIFICATE=false     # Verify TLS certificates\n"
"    TXDL_ARIA2C=aria2c               # aria2c binary used for magnet links and torrents\n"
"\n"
"EXIT CODES:\n"
"    0 success, 1 input error, 2 aria2c missing, 3 disk or permission error,\n"
"    4 download or resume failure, 130 interrupted\n";
    cout.flush();
}

Options parse_options(int argc, char* argv[]){
    Options opt;
    optind = 0; // 0 makes glibc reinitialise its scanner between calls
    opterr = 0;

    int c;
    while((c = getopt(argc, argv, ":l:d:tr:h")) != -1){
        switch(c){
            case 'l':
                opt.link = optarg;
                break;
            case 'd':
                opt.download_dir = optarg;
                break;
            case 't':
                opt.use_recent_torrent = true;
                break;
            case 'r':
                opt.resume_file = optarg;
                break;
            case 'h':
                opt.help = true;
                break;
            case ':':
                if(opt.error.empty()){
                    opt.error = string("Option -") + static_cast<char>(optopt) + " requires an argument";
                }
                break;
            default:
                if(opt.error.empty()){
                    opt.error = string("Invalid option: -") + static_cast<char>(optopt);
                }
                break;
        }
    }
    if(opt.error.empty() && optind < argc){
        opt.error = string("Unexpected argument: ") + argv[optind];
    }
    if(opt.error.empty()){
        int count = 0;
        if(!opt.link.empty()) ++count;
        if(opt.use_recent_torrent) ++count;
        if(!opt.resume_file.empty()) ++count;
        if(count == 0){
            opt.error = "No download option specified. Use -l, -t, or -r";
        }else if(count > 1){
            opt.error = "Only one download option (-l, -t, or -r) can be used at a time";
        }
    }
    return opt;
}

//accepts 1048576, 512K, 1M, 2G (1024-based)
bool parse_size(const string& text, curl_off_t& out){
    if(text.empty() || !isdigit(static_cast<unsigned char>(text[0]))){
        return false;
    }
    errno = 0;
    char* endp = nullptr;
    unsigned long long value = strtoull(text.c_str(), &endp, 10);
    if(errno == ERANGE){
        return false;
    }
    string suffix(endp);
    unsigned long long mult = 1;
    if(suffix == "K" || suffix == "k"){
        mult = 1024ULL;
    }else if(suffix == "M" || suffix == "m"){
        mult = 1024ULL * 1024;
    }else if(suffix == "G" || suffix == "g"){
        mult = 1024ULL * 1024 * 1024;
    }else if(!suffix.empty()){
        return false;
    }
    if(value > static_cast<unsigned long long>(LLONG_MAX) / mult){
        return false;
    }
    out = static_cast<curl_off_t>(value * mult);
    return true;
}

static bool parse_long(const char* text, long min_value, long& out){
    errno = 0;
    char* endp = nullptr;
    long v = strtol(text, &endp, 10);
    if(errno != 0 || endp == text || *endp != '\0' || v < min_value || v > INT_MAX){
        return false;
    }
    out = v;
    return true;
}

static int read_int(const char* name, long min_value, int& field){
    const char* value = getenv(name);
    if(!value){
        return 0;
    }
    long parsed = 0;
    if(!parse_long(value, min_value, parsed)){
        print_error(string("Invalid value for ") + name + ": '" + value + "'");
        return 1;
    }
    field = static_cast<int>(parsed);
    return 0;
}

//fills cfg from the environment, return 0 on success, non-zero on a malformed value
int load_config(Config& cfg){
    if(read_int("ARIA2_MAX_CONNECTIONS", 1, cfg.max_connections) != 0) return 1;
    if(read_int("ARIA2_MAX_CONCURRENT_DOWNLOADS", 1, cfg.max_concurrent_downloads) != 0) return 1;
    if(read_int("ARIA2_TIMEOUT", 1, cfg.timeout) != 0) return 1;
    if(read_int("ARIA2_RETRY_WAIT", 0, cfg.retry_wait) != 0) return 1;
    if(read_int("ARIA2_MAX_TRIES", 1, cfg.max_tries) != 0) return 1;

    const char* split = getenv("ARIA2_MIN_SPLIT_SIZE");
    if(split){
        curl_off_t bytes = 0;
        if(!parse_size(split, bytes) || bytes <= 0){
            print_error(string("Invalid value for ARIA2_MIN_SPLIT_SIZE: '") + split + "'");
            return 1;
        }
        cfg.min_split_size = bytes;
        cfg.min_split_size_text = split;
    }

    const char* free_mb = getenv("TXDL_MIN_FREE_MB");
    if(free_mb){
        long parsed = 0;
        if(!parse_long(free_mb, 0, parsed)){
            print_error(string("Invalid value for TXDL_MIN_FREE_MB: '") + free_mb + "'");
            return 1;
        }
        cfg.min_free_mb = parsed;
    }

    const char* check = getenv("TXDL_CHECK_CERTIFICATE");
    if(check){
        string v(check);
        if(v == "true" || v == "1" || v == "yes"){
            cfg.check_certificate = true;
        }else if(v == "false" || v == "0" || v == "no"){
            cfg.check_certificate = false;
        }else{
            print_error("Invalid value for TXDL_CHECK_CERTIFICATE: '" + v + "'");
            return 1;
        }
    }

    const char* aria2c = getenv("TXDL_ARIA2C");
    if(aria2c && *aria2c){
        cfg.aria2c = aria2c;
    }
    return 0;
}
