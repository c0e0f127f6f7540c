#include "downloader.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>

// newline characters would break the line based format
static string one_line(const string& s){
    string out;
    for(char ch : s){
        if(ch != '\r' && ch != '\n'){
            out += ch;
        }
    }
    return out;
}

//writes path.tmp, flushes it and renames it over path so a crash never leaves half a file
//return 0 on success, non-zero on fail
int save_control_file(const string& path, const ControlState& st){
    string tmp = path + ".tmp";
    FILE* fp = fopen(tmp.c_str(), "w");
    if(!fp){
        perror("fopen control file failed");
        return 1;
    }

    fprintf(fp, "%s\n", CONTROL_MAGIC);
    fprintf(fp, "url %s\n", one_line(st.url).c_str());
    fprintf(fp, "size %lld\n", static_cast<long long>(st.total_size));
    fprintf(fp, "etag %s\n", one_line(st.etag).c_str());
    fprintf(fp, "last-modified %s\n", one_line(st.last_modified).c_str());
    fprintf(fp, "min-split-size %lld\n", static_cast<long long>(st.min_split_size));
    fprintf(fp, "connections %d\n", st.connections);
    fprintf(fp, "segments %zu\n", st.segments.size());
    for(const auto& c : st.segments){
        fprintf(fp, "%lld %lld %lld\n", static_cast<long long>(c.start),
                static_cast<long long>(c.current), static_cast<long long>(c.end));
    }

    bool ok = fflush(fp) == 0 && fsync(fileno(fp)) == 0;
    if(fclose(fp) != 0){
        ok = false;
    }
    if(!ok){
        perror("writing control file failed");
        unlink(tmp.c_str());
        return 1;
    }
    if(rename(tmp.c_str(), path.c_str()) != 0){
        perror("rename control file failed");
        unlink(tmp.c_str());
        return 1;
    }
    return 0;
}

bool is_own_control_file(const string& path){
    ifstream in(path.c_str());
    string first;
    return in && getline(in, first) && first == CONTROL_MAGIC;
}

static bool read_field(istream& in, const string& key, string& value){
    string line;
    if(!getline(in, line)){
        return false;
    }
    if(line == key){
        value.clear();
        return true;
    }
    if(line.compare(0, key.size() + 1, key + " ") != 0){
        return false;
    }
    value = line.substr(key.size() + 1);
    return true;
}

static bool to_number(const string& text, long long& out){
    if(text.empty()){
        return false;
    }
    errno = 0;
    char* endp = nullptr;
    out = strtoll(text.c_str(), &endp, 10);
    return errno == 0 && *endp == '\0';
}

//parses and validates a control file written by save_control_file()
//return 0 on success, non-zero on a missing, foreign or corrupted file
int load_control_file(const string& path, ControlState& st){
    ifstream in(path.c_str());
    if(!in){
        return 1;
    }
    string line;
    if(!getline(in, line) || line != CONTROL_MAGIC){
        return 1;
    }

    string url, size, connections, split, count;
    if(!read_field(in, "url", url) ||
       !read_field(in, "size", size) ||
       !read_field(in, "etag", st.etag) ||
       !read_field(in, "last-modified", st.last_modified) ||
       !read_field(in, "min-split-size", split) ||
       !read_field(in, "connections", connections) ||
       !read_field(in, "segments", count)){
        return 1;
    }

    long long total = 0, split_size = 0, conns = 0, n = 0;
    if(url.empty() || !to_number(size, total) || !to_number(split, split_size) ||
       !to_number(connections, conns) || !to_number(count, n) ||
       total <= 0 || n < 1 || n > total){
        return 1;
    }

    st.url = url;
    st.total_size = total;
    st.min_split_size = split_size;
    st.connections = static_cast<int>(conns);
    st.segments.clear();

    //segments must be contiguous and cover [0, size) exactly
    long long expected_start = 0;
    for(long long i = 0; i < n; ++i){
        if(!getline(in, line)){
            return 1;
        }
        istringstream ls(line);
        long long start, current, end;
        string extra;
        if(!(ls >> start >> current >> end) || (ls >> extra)){
            return 1;
        }
        if(start != expected_start || end < start || current < start || current > end + 1){
            return 1;
        }
        Chunk c;
        c.id = static_cast<int>(i) + 1;
        c.start = start;
        c.current = current;
        c.end = end;
        st.segments.push_back(c);
        expected_start = end + 1;
    }
    if(expected_start != total){
        return 1;
    }
    return 0;
}
