#include "test-util.h"

static Options parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return parse_options(static_cast<int>(args.size()), argv.data());
}

static bool has(const std::vector<std::string>& v, const std::string& s) {
    for (const auto& x : v) if (x == s) return true;
    return false;
}

int main() {
    std::cout << "Testing parse_options..\n";
    Options o = parse({"txdl", "-l", "https://example.com/a.zip"});
    printResult(o.error.empty() && o.link == "https://example.com/a.zip", "Link only:                     ");

    o = parse({"txdl", "-t", "-d", "/sdcard/x"});
    printResult(o.error.empty() && o.use_recent_torrent && o.download_dir == "/sdcard/x", "Recent torrent with dir:       ");

    o = parse({"txdl", "-r", "file.zip"});
    printResult(o.error.empty() && o.resume_file == "file.zip", "Resume:                        ");

    o = parse({"txdl"});
    printResult(!o.help && !o.error.empty(), "No option is an error:         ");

    o = parse({"txdl", "-d", "/tmp"});
    printResult(!o.error.empty(), "Directory alone is an error:   ");

    o = parse({"txdl", "-l", "https://a/b", "-t"});
    printResult(!o.error.empty(), "-l with -t is an error:        ");

    o = parse({"txdl", "-t", "-r", "f"});
    printResult(!o.error.empty(), "-t with -r is an error:        ");

    o = parse({"txdl", "-l", "x", "-r", "f", "-t"});
    printResult(!o.error.empty(), "All three is an error:         ");

    o = parse({"txdl", "-x"});
    printResult(o.error == "Invalid option: -x", "Unknown option:                ");

    o = parse({"txdl", "-l"});
    printResult(o.error == "Option -l requires an argument", "Missing argument:              ");

    o = parse({"txdl", "-t", "stray"});
    printResult(o.error == "Unexpected argument: stray", "Stray argument:                ");

    o = parse({"txdl", "-l", "a", "-t", "-h"});
    printResult(o.help, "-h wins over a usage error:    ");

    o = parse({"txdl", "-x", "-h"});
    printResult(o.help, "-h wins over a bad option:     ");

    std::cout << "Testing parse_size..\n";
    curl_off_t v = 0;
    printResult(parse_size("1M", v) && v == 1024 * 1024, "1M:                            ");
    printResult(parse_size("512k", v) && v == 512 * 1024, "512k:                          ");
    printResult(parse_size("2G", v) && v == 2LL * 1024 * 1024 * 1024, "2G:                            ");
    printResult(parse_size("1000", v) && v == 1000, "Plain bytes:                   ");
    printResult(!parse_size("", v), "Empty rejected:                ");
    printResult(!parse_size("M", v), "Suffix only rejected:          ");
    printResult(!parse_size("-1M", v), "Negative rejected:             ");
    printResult(!parse_size("1MB", v), "Unknown suffix rejected:       ");
    printResult(!parse_size("99999999999999999999", v), "Overflow rejected:             ");

    std::cout << "Testing load_config..\n";
    unsetenv("ARIA2_MAX_CONNECTIONS");
    unsetenv("ARIA2_MIN_SPLIT_SIZE");
    unsetenv("ARIA2_MAX_CONCURRENT_DOWNLOADS");
    unsetenv("ARIA2_TIMEOUT");
    unsetenv("ARIA2_RETRY_WAIT");
    unsetenv("ARIA2_MAX_TRIES");
    unsetenv("TXDL_MIN_FREE_MB");
    unsetenv("TXDL_CHECK_CERTIFICATE");
    unsetenv("TXDL_ARIA2C");
    Config cfg;
    printResult(load_config(cfg) == 0 && cfg.max_connections == 16 && cfg.min_split_size == 1024 * 1024 &&
                cfg.max_concurrent_downloads == 3 && cfg.timeout == 60 && cfg.retry_wait == 3 &&
                cfg.max_tries == 5 && cfg.min_free_mb == 100 && !cfg.check_certificate &&
                cfg.aria2c == "aria2c", "Defaults:                      ");

    setenv("ARIA2_MAX_CONNECTIONS", "4", 1);
    setenv("ARIA2_MIN_SPLIT_SIZE", "256K", 1);
    setenv("ARIA2_RETRY_WAIT", "0", 1);
    setenv("TXDL_CHECK_CERTIFICATE", "true", 1);
    cfg = Config();
    printResult(load_config(cfg) == 0 && cfg.max_connections == 4 && cfg.min_split_size == 256 * 1024 &&
                cfg.min_split_size_text == "256K" && cfg.retry_wait == 0 && cfg.check_certificate,
                "Overrides:                     ");

    setenv("ARIA2_MAX_TRIES", "abc", 1);
    cfg = Config();
    printResult(load_config(cfg) != 0, "Non-numeric rejected:          ");
    setenv("ARIA2_MAX_TRIES", "0", 1);
    cfg = Config();
    printResult(load_config(cfg) != 0, "Zero tries rejected:           ");
    unsetenv("ARIA2_MAX_TRIES");
    setenv("ARIA2_MIN_SPLIT_SIZE", "0", 1);
    cfg = Config();
    printResult(load_config(cfg) != 0, "Zero split size rejected:      ");
    unsetenv("ARIA2_MIN_SPLIT_SIZE");
    setenv("TXDL_CHECK_CERTIFICATE", "maybe", 1);
    cfg = Config();
    printResult(load_config(cfg) != 0, "Bad boolean rejected:          ");
    unsetenv("TXDL_CHECK_CERTIFICATE");
    unsetenv("ARIA2_MAX_CONNECTIONS");
    unsetenv("ARIA2_RETRY_WAIT");

    std::cout << "Testing classify_input..\n";
    printResult(classify_input("https://example.com/f") == INPUT_HTTP, "https:                         ");
    printResult(classify_input("HTTP://example.com/f") == INPUT_HTTP, "Upper case scheme:             ");
    printResult(classify_input("magnet:?xt=urn:btih:abc&dn=x y") == INPUT_MAGNET, "magnet:                        ");
    printResult(classify_input("ftp://example.com/f") == INPUT_INVALID, "ftp rejected:                  ");
    printResult(classify_input("/nonexistent/a.torrent") == INPUT_INVALID, "Missing torrent rejected:      ");
    std::string dir = makeTempDir();
    writeFile(dir + "/a.torrent", "d4:infod4:name1:aee");
    printResult(classify_input(dir + "/a.torrent") == INPUT_TORRENT, "Existing torrent:              ");
    removeTree(dir);

    std::cout << "Testing file names..\n";
    printResult(filename_from_url("https://h/a/b/file.zip?x=1#frag") == "file.zip", "Query stripped:                ");
    printResult(filename_from_url("https://h/a/my%20file.iso") == "my file.iso", "Percent decoded:               ");
    printResult(filename_from_url("https://h/") == "index.html", "Empty path:                    ");
    printResult(filename_from_url("https://h") == "index.html", "No path:                       ");
    printResult(filename_from_url("https://h/a/..") == "index.html", "Dot-dot refused:               ");
    printResult(filename_from_url("https://h/a%2F..%2Fetc%2Fpasswd") == "passwd", "Encoded slash refused:         ");
    printResult(filename_from_disposition("attachment; filename=\"report 1.pdf\"") == "report 1.pdf", "Quoted disposition:            ");
    printResult(filename_from_disposition("attachment; filename=data.csv; size=3") == "data.csv", "Bare disposition:              ");
    printResult(filename_from_disposition("attachment; filename*=UTF-8''na%C3%AFve.txt; filename=\"naive.txt\"") == "na\xC3\xAFve.txt", "Extended disposition wins:     ");
    printResult(filename_from_disposition("attachment; filename=\"../../x.sh\"") == "x.sh", "Path in disposition dropped:   ");
    printResult(filename_from_disposition("inline") == "", "No filename:                   ");
    printResult(url_decode("a%2Bb+c%zz") == "a+b+c%zz", "url_decode leaves junk:        ");

    std::cout << "Testing build_aria2_args..\n";
    Config defaults;
    std::vector<std::string> args = build_aria2_args("magnet:?xt=urn:btih:abc&dn=a b", "/dl", defaults);
    printResult(args.front() == "aria2c" && args.back() == "magnet:?xt=urn:btih:abc&dn=a b", "Binary first, input last:      ");
    printResult(has(args, "--dir=/dl") && has(args, "--max-connection-per-server=16") &&
                has(args, "--min-split-size=1M") && has(args, "--max-concurrent-downloads=3") &&
                has(args, "--timeout=60") && has(args, "--retry-wait=3") && has(args, "--max-tries=5"),
                "Configured values:             ");
    printResult(has(args, "--seed-time=0") && has(args, "--enable-dht=true") &&
                has(args, "--listen-port=6881-6999"), "BitTorrent options for magnet: ");
    printResult(has(args, "--check-certificate=false") && has(args, "--split=16") &&
                has(args, "--continue=true") && has(args, "--summary-interval=5"), "Fixed options:                 ");
    args = build_aria2_args("/dl/x.torrent", "/dl", defaults);
    printResult(has(args, "--bt-max-peers=100"), "BitTorrent options for file:   ");
    args = build_aria2_args("https://h/f", "/dl", defaults);
    printResult(!has(args, "--seed-time=0"), "No BitTorrent options for http:");

    std::cout << (failures == 0 ? "All tests passed\n" : "Some tests failed\n");
    return failures == 0 ? 0 : 1;
}
