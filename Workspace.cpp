#include "downloader.h"

#include <cerrno>
#include <cstdlib>
#include <dirent.h>
#include <pwd.h>
#include <sys/statvfs.h>

bool file_exists(const string& path){
    struct stat st{};
    return stat(path.c_str(), &st) == 0;
}

string join_path(const string& dir, const string& name){
    if(dir.empty()){
        return name;
    }
    if(dir[dir.size() - 1] == '/'){
        return dir + name;
    }
    return dir + "/" + name;
}

string parent_dir(const string& path){
    size_t slash = path.find_last_of('/');
    if(slash == string::npos){
        return ".";
    }
    if(slash == 0){
        return "/";
    }
    return path.substr(0, slash);
}

static string home_dir(){
    const char* home = getenv("HOME");
    if(home && *home){
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    if(pw && pw->pw_dir){
        return pw->pw_dir;
    }
    return ".";
}

string expand_home(const string& path){
    if(path == "~"){
        return home_dir();
    }
    if(path.compare(0, 2, "~/") == 0){
        return home_dir() + path.substr(1);
    }
    return path;
}

string default_download_dir(){
    return join_path(home_dir(), "Downloads");
}

//mkdir -p, return 0 on success
static int make_dirs(const string& dir){
    string partial;
    size_t pos = 0;
    while(pos != string::npos){
        pos = dir.find('/', pos + 1);
        partial = dir.substr(0, pos);
        if(partial.empty()){
            continue;
        }
        if(mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST){
            return -1;
        }
    }
    struct stat st{};
    if(stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)){
        errno = ENOTDIR;
        return -1;
    }
    return 0;
}

//create the directory if needed and make sure it is writable
int check_permissions(const string& dir){
    struct stat st{};
    if(stat(dir.c_str(), &st) != 0){
        if(make_dirs(dir) != 0){
            print_error("Cannot create directory: " + dir + " (" + strerror(errno) + ")");
            return EXIT_CODE_STORAGE;
        }
        print_info("Created directory: " + dir);
    }else if(!S_ISDIR(st.st_mode)){
        print_error("Not a directory: " + dir);
        return EXIT_CODE_STORAGE;
    }

    if(access(dir.c_str(), W_OK | X_OK) != 0){
        print_error("No write permission for directory: " + dir);
        return EXIT_CODE_STORAGE;
    }
    return EXIT_CODE_OK;
}

//-1 when the file system cannot be queried
long available_space_mb(const string& dir){
    struct statvfs vfs{};
    if(statvfs(dir.c_str(), &vfs) != 0){
        return -1;
    }
    unsigned long long bytes = static_cast<unsigned long long>(vfs.f_bavail) *
                               static_cast<unsigned long long>(vfs.f_frsize);
    return static_cast<long>(bytes / (1024 * 1024));
}

int check_disk_space(const string& dir, long required_mb){
    long available = available_space_mb(dir);
    if(available < 0 || available < required_mb){
        ostringstream os;
        os << "Insufficient disk space. At least " << required_mb << "MB required in " << dir;
        print_error(os.str());
        return EXIT_CODE_STORAGE;
    }
    print_info("Available disk space: " + to_string(available) + "MB");
    return EXIT_CODE_OK;
}

//walks dir recursively, calling visit(path, st) for every regular file; symlinks are not followed
template <typename Visitor>
static void walk_files(const string& dir, Visitor visit){
    DIR* d = opendir(dir.c_str());
    if(!d){
        return;
    }
    struct dirent* entry;
    while((entry = readdir(d)) != nullptr){
        string name = entry->d_name;
        if(name == "." || name == ".."){
            continue;
        }
        string path = join_path(dir, name);
        struct stat st{};
        if(lstat(path.c_str(), &st) != 0){
            continue;
        }
        if(S_ISDIR(st.st_mode)){
            walk_files(path, visit);
        }else if(S_ISREG(st.st_mode)){
            visit(path, st);
        }
    }
    closedir(d);
}

//newest *.torrent under dir, return 0 and set out when one exists
int find_recent_torrent(const string& dir, string& out){
    string best;
    struct timespec best_time{};
    walk_files(dir, [&](const string& path, const struct stat& st){
        if(!ends_with(path, ".torrent")){
            return;
        }
        const struct timespec& t = st.st_mtim;
        bool newer = best.empty() ||
                     t.tv_sec > best_time.tv_sec ||
                     (t.tv_sec == best_time.tv_sec && t.tv_nsec > best_time.tv_nsec) ||
                     (t.tv_sec == best_time.tv_sec && t.tv_nsec == best_time.tv_nsec && path > best);
        if(newer){
            best = path;
            best_time = t;
        }
    });

    if(best.empty()){
        print_error("No .torrent files found in " + dir);
        return EXIT_CODE_INPUT;
    }
    out = best;
    return EXIT_CODE_OK;
}

//deletes every *.aria2 under dir, returns how many were removed
int cleanup_control_files(const string& dir){
    print_info("Cleaning up temporary files matching: *" CONTROL_SUFFIX);
    int removed = 0;
    walk_files(dir, [&](const string& path, const struct stat&){
        if(ends_with(path, CONTROL_SUFFIX) && unlink(path.c_str()) == 0){
            ++removed;
        }
    });
    return removed;
}

//file.zip -> file.1.zip -> file.2.zip ... until the name is free
string unique_path(const string& path){
    if(!file_exists(path)){
        return path;
    }
    size_t slash = path.find_last_of('/');
    size_t name_start = slash == string::npos ? 0 : slash + 1;
    size_t dot = path.find_last_of('.');
    string stem = path;
    string ext;
    if(dot != string::npos && dot > name_start){
        stem = path.substr(0, dot);
        ext = path.substr(dot);
    }
    for(int i = 1; ; ++i){
        string candidate = stem + "." + to_string(i) + ext;
        if(!file_exists(candidate)){
            return candidate;
        }
    }
}
