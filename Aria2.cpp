#include "downloader.h"

#include <cerrno>
#include <cstdlib>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

//full path of an executable found through $PATH, empty when missing
string find_executable(const string& name){
    if(name.empty()){
        return "";
    }
    if(name.find('/') != string::npos){
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char* path = getenv("PATH");
    if(!path){
        return "";
    }
    stringstream ss(path);
    string dir;
    while(getline(ss, dir, ':')){
        string candidate = join_path(dir.empty() ? "." : dir, name);
        struct stat st{};
        if(stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           access(candidate.c_str(), X_OK) == 0){
            return candidate;
        }
    }
    return "";
}

//argv for aria2c, the input goes last; no shell is involved so nothing needs quoting
vector<string> build_aria2_args(const string& input, const string& dir, const Config& cfg){
    vector<string> args;
    args.push_back(cfg.aria2c);
    args.push_back("--dir=" + dir);
    args.push_back("--max-connection-per-server=" + to_string(cfg.max_connections));
    args.push_back("--min-split-size=" + cfg.min_split_size_text);
    args.push_back("--max-concurrent-downloads=" + to_string(cfg.max_concurrent_downloads));
    args.push_back("--timeout=" + to_string(cfg.timeout));
    args.push_back("--retry-wait=" + to_string(cfg.retry_wait));
    args.push_back("--max-tries=" + to_string(cfg.max_tries));
    args.push_back("--continue=true");
    args.push_back("--auto-file-renaming=true");
    args.push_back("--split=" + to_string(MAX_SPLIT));
    args.push_back("--file-allocation=falloc");
    args.push_back(string("--check-certificate=") + (cfg.check_certificate ? "true" : "false"));

    InputKind kind = classify_input(input);
    if(kind == INPUT_MAGNET || ends_with(input, ".torrent")){
        args.push_back("--seed-time=0");
        args.push_back("--bt-max-peers=100");
        args.push_back("--bt-request-peer-speed-limit=100K");
        args.push_back("--max-upload-limit=1K");
        args.push_back("--listen-port=6881-6999");
        args.push_back("--enable-dht=true");
        args.push_back("--bt-enable-lpd=true");
        args.push_back("--bt-enable-hook-after-hash-check=true");
    }

    args.push_back("--summary-interval=5");
    args.push_back("--console-log-level=notice");
    args.push_back(input);
    return args;
}

//spawns args[0] and waits for it; SIGINT/SIGTERM are forwarded to the child
//return the child's exit status, 128+signal if it was killed, EXIT_CODE_INTERRUPTED, or -1 if it could not start
int run_process(const vector<string>& args){
    if(args.empty()){
        return -1;
    }
    vector<char*> argv;
    argv.reserve(args.size() + 1);
    for(const auto& arg : args){
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int spawn_status = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if(spawn_status != 0){
        print_error("Cannot start " + args[0] + ": " + strerror(spawn_status));
        return -1;
    }

    int status = 0;
    bool forwarded = false;
    while(true){
        pid_t r = waitpid(pid, &status, WNOHANG);
        if(r == pid){
            break;
        }
        if(r < 0 && errno != EINTR){
            perror("waitpid failed");
            return -1;
        }
        if(g_interrupted && !forwarded){
            kill(pid, SIGTERM);
            forwarded = true;
        }
        this_thread::sleep_for(chrono::milliseconds(100));
    }

    if(g_interrupted){
        return EXIT_CODE_INTERRUPTED;
    }
    if(WIFEXITED(status)){
        return WEXITSTATUS(status);
    }
    if(WIFSIGNALED(status)){
        return 128 + WTERMSIG(status);
    }
    return -1;
}

//magnet links and .torrent files go to aria2c
int download_with_aria2(const string& input, const string& dir, const Config& cfg){
    if(find_executable(cfg.aria2c).empty()){
        print_error(cfg.aria2c + " not found. Please install it manually: pkg install aria2");
        return EXIT_CODE_DEPENDENCY;
    }

    print_info("Starting download...");
    print_info("Input: " + input);
    print_info("Download directory: " + dir);
    print_info("Executing: aria2c with optimized settings");

    int rc = run_process(build_aria2_args(input, dir, cfg));
    if(rc == 0){
        print_success("Download completed successfully!");
        return EXIT_CODE_OK;
    }
    if(g_interrupted){
        print_warning("Download interrupted by user");
        return EXIT_CODE_INTERRUPTED;
    }
    print_error("Download failed with exit code: " + to_string(rc));
    cleanup_control_files(dir);
    return EXIT_CODE_DOWNLOAD;
}
