#include "relaygate/core/http/curl/client.hpp"

#include <curl/curl.h>

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

#include "lcr/log/logger.hpp"

namespace relaygate::core::http::curl {

namespace {

constexpr std::size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

struct CurlDefaults {
    static constexpr long FOLLOW_LOCATION = 0L;
    static constexpr long NO_PROGRESS     = 1L;
    static constexpr long NO_SIGNAL       = 1L;
};

// -----------------------------------------------------------------------------
// Easy handle owning the per-request scratch state
// -----------------------------------------------------------------------------
class Easy {
public:
    Easy()
        : handle_(curl_easy_init())
    {
        if (handle_ == nullptr) {
            throw std::runtime_error("curl_easy_init failed");
        }
        error_buf_[0] = '\0';
    }

    ~Easy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }
        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    Easy(const Easy&) = delete;
    Easy& operator=(const Easy&) = delete;
    Easy(Easy&&) = delete;
    Easy& operator=(Easy&&) = delete;

    template <typename T>
    void setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle_, option, value);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void prepare(const request::BuiltRequest& req, const ClientConfig& cfg, Response& resp) {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_URL, req.url.c_str());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg.connect_timeout.count()));
        setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(cfg.total_timeout.count()));
        setopt(CURLOPT_SSL_VERIFYPEER, cfg.verify_peer ? 1L : 0L);
        setopt(CURLOPT_SSL_VERIFYHOST, cfg.verify_peer ? 2L : 0L);

        if (req.method == "GET") {
            setopt(CURLOPT_HTTPGET, 1L);
        }
        else {
            setopt(CURLOPT_CUSTOMREQUEST, req.method.c_str());
        }
        if (req.body.has()) {
            setopt(CURLOPT_POSTFIELDS, req.body.value().c_str());
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.value().size()));
        }

        for (const auto& h : req.headers) {
            const std::string line = h.name + ": " + h.value;
            curl_slist* next = curl_slist_append(headers_, line.c_str());
            if (next == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers_ = next;
        }
        // Suppress the implicit "Expect: 100-continue" on bodies
        curl_slist* next = curl_slist_append(headers_, "Expect:");
        if (next == nullptr) {
            throw std::runtime_error("curl_slist_append failed");
        }
        headers_ = next;
        setopt(CURLOPT_HTTPHEADER, headers_);

        setopt(CURLOPT_WRITEFUNCTION, &Easy::write_cb);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(&resp.body));
        setopt(CURLOPT_HEADERFUNCTION, &Easy::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(&resp.headers));
    }

    [[nodiscard]]
    bool perform(Response& resp, std::string& error) {
        const auto rc = curl_easy_perform(handle_);
        if (rc != CURLE_OK) {
            error = "curl_easy_perform failed: ";
            error += (error_buf_[0] != '\0') ? error_buf_.data() : curl_easy_strerror(rc);
            return false;
        }
        long code = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        resp.status_code = code;
        return true;
    }

private:
    static size_t write_cb(char* data, size_t size, size_t n_items, void* userdata) {
        auto* body = static_cast<std::string*>(userdata);
        const size_t bytes = size * n_items;
        body->append(data, bytes);
        return bytes;
    }

    // Collects "Name: value" lines. A new status line (redirect or 100-continue)
    // resets the list so only the final response's headers survive.
    static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* headers = static_cast<HeaderList*>(userdata);
        const size_t bytes = size * n_items;
        std::string_view line(buffer, bytes);

        if (line.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return bytes;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return bytes;
        }
        std::string_view name = line.substr(0, colon);
        std::string_view value = line.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
        while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) value.remove_suffix(1);
        headers->push_back(Header{std::string(name), std::string(value)});
        return bytes;
    }

    CURL* handle_{};
    curl_slist* headers_{};
    std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
};

} // namespace


Global::Global() {
    const auto rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

Global::~Global() {
    curl_global_cleanup();
}


bool Client::perform(const request::BuiltRequest& req, Response& resp, std::string& error) noexcept {
    resp = Response{};
    try {
        Easy easy;
        easy.prepare(req, cfg_, resp);
        RG_DEBUG("[HTTP] " << req.method << " " << req.url);
        if (!easy.perform(resp, error)) {
            RG_WARN("[HTTP] " << req.method << " " << req.url << " failed: " << error);
            return false;
        }
        RG_DEBUG("[HTTP] " << req.method << " " << req.url << " -> " << resp.status_code
                 << " (" << resp.body.size() << " bytes)");
        return true;
    }
    catch (const std::exception& e) {
        error = e.what();
        RG_ERROR("[HTTP] Request setup failed: " << error);
        return false;
    }
}

} // namespace relaygate::core::http::curl
