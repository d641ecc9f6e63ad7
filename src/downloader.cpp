#include "downloader.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {

constexpr long CONNECT_TIMEOUT_SECONDS = 30;
// Abort a transfer that stays below 1 byte/s for this long.
constexpr long STALL_TIMEOUT_SECONDS = 60;

struct Transfer {
    std::ofstream* out;
    bool show_progress;
    int last_percent = -1;
};

size_t write_to_stream(void* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    size_t bytes = size * nmemb;
    transfer->out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(bytes));
    return transfer->out->good() ? bytes : 0;
}

int report_progress(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(userdata);
    if (!transfer->show_progress || dltotal <= 0) {
        return 0;
    }
    int percent = static_cast<int>(dlnow * 100 / dltotal);
    if (percent == transfer->last_percent) {
        return 0;
    }
    transfer->last_percent = percent;
    std::cout << "\r" << COLOR_GREEN << get_string("info.log_prefix") << COLOR_WHITE
              << get_string("info.downloading") << " " << std::setw(3) << percent << "%"
              << COLOR_RESET << std::flush;
    return 0;
}

struct CurlDeleter {
    void operator()(CURL* curl) const {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

} // anonymous namespace

void download_file(const std::string& url, const fs::path& output_path, bool show_progress) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw DevsetupException(string_format("error.download_failed", url));
    }

    // Written beside the target and renamed on success, so a partial script is never run.
    fs::path partial_path = output_path;
    partial_path += ".part";
    std::ofstream ofile(partial_path, std::ios::binary | std::ios::trunc);
    if (!ofile) {
        throw DevsetupException(string_format("error.create_file_failed", partial_path.string()));
    }

    Transfer transfer{&ofile, show_progress && isatty(STDOUT_FILENO)};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, CONNECT_TIMEOUT_SECONDS);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, STALL_TIMEOUT_SECONDS);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "devsetup");
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, transfer.show_progress ? 0L : 1L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, report_progress);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &transfer);

    CURLcode res = curl_easy_perform(curl.get());
    if (transfer.last_percent >= 0) {
        std::cout << std::endl;
    }
    ofile.close();

    std::error_code ec;
    if (res != CURLE_OK) {
        fs::remove(partial_path, ec);
        throw DevsetupException(string_format("error.download_failed", url) + ": " + curl_easy_strerror(res));
    }
    if (!ofile) {
        fs::remove(partial_path, ec);
        throw DevsetupException(string_format("error.create_file_failed", output_path.string()));
    }
    fs::rename(partial_path, output_path, ec);
    if (ec) {
        fs::remove(partial_path, ec);
        throw DevsetupException(string_format("error.create_file_failed", output_path.string()));
    }
}

void download_with_retries(const std::string& url, const fs::path& output_path, int max_retries, bool show_progress) {
    for (int attempt = 1;; ++attempt) {
        try {
            download_file(url, output_path, show_progress);
            return;
        } catch (const DevsetupException& e) {
            if (attempt >= max_retries) {
                throw;
            }
            log_warning(string_format("warning.download_retry", std::string(e.what())));
        }
    }
}
