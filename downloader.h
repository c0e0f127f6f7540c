#ifndef DOWNLOADER_H
#define DOWNLOADER_H

#include <curl/curl.h>
#include <fcntl.h>  //open
#include <sys/stat.h> //mode constants, stat
#include <sys/types.h>
#include <unistd.h> //pwrite, ftruncate, close
#include <signal.h>

#include <iostream>
#include <cstdio> //perror
#include <string>
#include <sstream>
#include <cstring>
#include <vector>
#include <thread>
#include <mutex>
#include <chrono>

using namespace std;

#define TXDL_VERSION "0.1.0"
#define CONTROL_SUFFIX ".aria2"
#define CONTROL_MAGIC "TXDL-CONTROL 1"
#define MAX_SPLIT 16

enum ExitCode{
    EXIT_CODE_OK = 0,
    EXIT_CODE_INPUT = 1,       //usage or input error
    EXIT_CODE_DEPENDENCY = 2,  //aria2c missing
    EXIT_CODE_STORAGE = 3,     //disk space or permission
    EXIT_CODE_DOWNLOAD = 4,    //download or resume failed
    EXIT_CODE_INTERRUPTED = 130
};

enum InputKind{
    INPUT_INVALID,
    INPUT_HTTP,
    INPUT_MAGNET,
    INPUT_TORRENT
};

//values read from the environment, see load_config()
class Config{
    public:
        int max_connections = 16;
        curl_off_t min_split_size = 1024 * 1024;
        string min_split_size_text = "1M";
        int max_concurrent_downloads = 3;
        int timeout = 60;      //seconds
        int retry_wait = 3;    //seconds
        int max_tries = 5;
        long min_free_mb = 100;
        bool check_certificate = false;
        string aria2c = "aria2c";
};

//parsed command line
class Options{
    public:
        string link;
        string resume_file;
        string download_dir;
        bool use_recent_torrent = false;
        bool help = false;
        string error; //non-empty on usage error
};

//result of the HEAD probe
class RemoteInfo{
    public:
        string effective_url;
        curl_off_t size = -1; //-1 = unknown
        bool accept_ranges = false;
        string etag;
        string last_modified;
        string filename; //from Content-Disposition, may be empty
        long status = 0;
};

class Progress{
    public:
        mutex mtx;
        curl_off_t total_size = 0;
        curl_off_t downloaded = 0;
        int last_percent = -1;
        chrono::steady_clock::time_point started = chrono::steady_clock::now();
        curl_off_t downloaded_at_start = 0;
};

class Chunk{
    public:
        Progress* prog = nullptr; //shared progress state
        string url; //URL to download
        int fd = -1;            // output file descriptor (shared, safe with pwrite())
        curl_off_t start = 0;   // inclusive, first byte of the segment
        curl_off_t current = 0; // next byte to write
        curl_off_t end = -1;    // inclusive
        int result = 1; //0 = OK, else fail
        CURL* handle = nullptr;
        bool checked_status = false;
        int id = 0;
        string error; //set by write_callback when it aborts the transfer
        char errbuf[CURL_ERROR_SIZE];

        bool done() const { return current > end; }
};

//everything persisted in the control file
class ControlState{
    public:
        string url;
        curl_off_t total_size = 0;
        string etag;
        string last_modified;
        curl_off_t min_split_size = 0;
        int connections = 0;
        vector<Chunk> segments; //only start, current, end are persisted
};

//single-connection download, used when size or range support is unknown
class Task{
    public:
        string url;
        string outpath;
        int result = 1; //0 = OK, else fail
        char errbuf[CURL_ERROR_SIZE];
        long last_percent = -1;
};

//logging
void print_error(const string& msg);
void print_warning(const string& msg);
void print_info(const string& msg);
void print_success(const string& msg);

//interrupt handling
extern volatile sig_atomic_t g_interrupted;
void install_signal_handlers();
bool sleep_interruptible(int seconds);

//options and configuration
Options parse_options(int argc, char* argv[]);
void show_help();
int load_config(Config& cfg);
bool parse_size(const string& text, curl_off_t& out);

//workspace
string expand_home(const string& path);
string default_download_dir();
int check_permissions(const string& dir);
int check_disk_space(const string& dir, long required_mb);
long available_space_mb(const string& dir);
int find_recent_torrent(const string& dir, string& out);
int cleanup_control_files(const string& dir);
string unique_path(const string& path);
bool file_exists(const string& path);
string join_path(const string& dir, const string& name);
string parent_dir(const string& path);

//validation
InputKind classify_input(const string& input);
bool ends_with(const string& s, const string& suffix);

//http helpers
int probe_remote(const string& url, const Config& cfg, RemoteInfo& info);
string filename_from_url(const string& url);
string filename_from_disposition(const string& header);
string url_decode(const string& s);
void apply_common_options(CURL* handle, const Config& cfg);

//segments and control file
vector<Chunk> plan_segments(curl_off_t total_size, const Config& cfg);
int save_control_file(const string& path, const ControlState& st);
int load_control_file(const string& path, ControlState& st);
bool is_own_control_file(const string& path);

//engine
int download_big_file(const string& url, const RemoteInfo& info, const string& outpath, const Config& cfg);
int run_segments(ControlState& st, const string& outpath, const Config& cfg);
int resume_big_file(const string& outpath, const Config& cfg);
int download_stream(const string& url, const string& outpath, const Config& cfg);
int download_http(const string& url, const string& dir, const Config& cfg);
int resume_download(const string& file, const string& dir, const Config& cfg);
int download_one_file(Task& t, const Config& cfg);
size_t write_data_file(void* buffer, size_t size, size_t nmemb, void *userp);
size_t write_callback(void* ptr, size_t size, size_t nmemb, void* userdata);
int abort_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t);
void report_progress(Progress& prog);
void download_one_chunk(Chunk& c, const Config& cfg);

//aria2c delegation
string find_executable(const string& name);
vector<string> build_aria2_args(const string& input, const string& dir, const Config& cfg);
int run_process(const vector<string>& args);
int download_with_aria2(const string& input, const string& dir, const Config& cfg);

//top level, returns the process exit code
int txdl_main(int argc, char* argv[]);


#endif // DOWNLOADER_H
