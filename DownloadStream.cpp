#include "downloader.h"

// progress_callback() reports a single-connection transfer; by percent when the size is known
static int progress_callback(void* clientp,
                             curl_off_t dltotal,
                             curl_off_t dlnow,
                             curl_off_t /*ultotal*/,
                             curl_off_t /*ulnow*/){
    if(g_interrupted){
        return 1; // abort the transfer
    }
    Task* t = static_cast<Task*>(clientp);
    if(!t){
        return 0;
    }

    if(dltotal > 0){
        long percent = static_cast<long>((dlnow * 100) / dltotal);
        if(percent > 100){
            percent = 100;
        }
        if(percent != t->last_percent){
            t->last_percent = percent;
            print_info("Downloading " + t->outpath + ": " + to_string(percent) + "%");
        }
    }else if(dlnow != 0 && dlnow / (1024 * 1024) != t->last_percent){
        // Track roughly by megabytes when total size is unknown.
        t->last_percent = static_cast<long>(dlnow / (1024 * 1024));
        print_info("Downloading " + t->outpath + ": " + to_string(t->last_percent) + " MiB received");
    }
    return 0;
}

 //write callback: write data into the FILE* passed via CURLOPT_WRITEDATA
 size_t write_data_file(void* buffer, size_t size, size_t nmemb, void *userp)
 {
    FILE* fp = static_cast<FILE*>(userp);
    size_t items = fwrite(buffer, size, nmemb, fp);
    if(items != nmemb){
        perror("Fwrite failed");
        return 0; // returning 0 tells libcurl to abort the transfer
    }
    return items * size; // MUST return bytes written
 }

// receive one task and download one file through a single connection
//return 0 on success, non-zero on fail
int download_one_file(Task& t, const Config& cfg){
    FILE* fp = fopen(t.outpath.c_str(), "wb");
    if(!fp){
        perror("fopen failed");
        return 1;
    }

    CURL* handle = curl_easy_init();
    if(!handle){
        fclose(fp);
        print_error("curl_easy_init failed!");
        return 1;
    }

    curl_easy_setopt(handle, CURLOPT_URL, t.url.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_data_file);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, fp);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, t.errbuf);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &t);
    apply_common_options(handle, cfg);

    t.errbuf[0] = '\0'; // ensure error buffer is null-terminated
    t.last_percent = -1;

    CURLcode rc = curl_easy_perform(handle);
    if(rc == CURLE_OK){
        long response_code = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response_code);
        // 0 for schemes without status codes
        if(response_code != 200 && response_code != 0){
            print_error("Unexpected HTTP status " + to_string(response_code) + " for " + t.url);
            rc = CURLE_HTTP_RETURNED_ERROR;
        }
    }

    if(fclose(fp) != 0 && rc == CURLE_OK){
        perror("fclose failed");
        rc = CURLE_WRITE_ERROR;
    }

    if(rc != CURLE_OK && !g_interrupted){
        const char* err = t.errbuf[0] ? t.errbuf : curl_easy_strerror(rc);
        print_warning("Error downloading " + t.url + ": " + err);
    }else if(rc == CURLE_OK){
        t.result = 0; // success
    }

    curl_easy_cleanup(handle);
    return t.result;
}

//used when the size is unknown or the server refuses ranges; nothing to resume, so no control file
int download_stream(const string& url, const string& outpath, const Config& cfg){
    Task t;
    t.url = url;
    t.outpath = outpath;
    print_info("Single connection download (size unknown or no range support)");

    for(int attempt = 1; attempt <= cfg.max_tries; ++attempt){
        t.result = 1;
        if(download_one_file(t, cfg) == 0){
            return EXIT_CODE_OK;
        }
        if(g_interrupted){
            print_warning("Download interrupted by user");
            return EXIT_CODE_INTERRUPTED;
        }
        if(attempt < cfg.max_tries){
            print_info("Retrying in " + to_string(cfg.retry_wait) + "s (attempt " +
                       to_string(attempt + 1) + "/" + to_string(cfg.max_tries) + ")");
            if(!sleep_interruptible(cfg.retry_wait)){
                print_warning("Download interrupted by user");
                return EXIT_CODE_INTERRUPTED;
            }
        }
    }
    print_error("Download failed: " + url);
    return EXIT_CODE_DOWNLOAD;
}
