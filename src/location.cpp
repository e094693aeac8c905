#include "dircache/location.hpp"

namespace dircache {

const char* scheme_to_string(Scheme scheme) {
    switch (scheme) {
        case Scheme::Http: return "http";
        case Scheme::Https: return "https";
    }
    return "https";
}

std::optional<Scheme> parse_scheme(const std::string& str) {
    if (str == "http") return Scheme::Http;
    if (str == "https") return Scheme::Https;
    return std::nullopt;
}

std::string Location::hostname() const {
    std::string host = host_strategy ? host_strategy(region) : s3_host(region);
    return bucket + "." + host;
}

std::string s3_host(const std::string& region) {
    if (region.empty() || region == "us-east-1") {
        return "s3.amazonaws.com";
    }
    return "s3-" + region + ".amazonaws.com";
}

std::string gcs_host(const std::string& region) {
    (void)region;
    return "storage.googleapis.com";
}

}  // namespace dircache
