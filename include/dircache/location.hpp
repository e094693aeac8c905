#pragma once

#include <functional>
#include <optional>
#include <string>

namespace dircache {

/// Credentials used to sign requests.
struct KeyPair {
    std::string id;
    std::string secret;
};

enum class Scheme {
    Http,
    Https
};

const char* scheme_to_string(Scheme scheme);
std::optional<Scheme> parse_scheme(const std::string& str);

/// Maps a region to the provider's endpoint host (without the bucket label).
using HostStrategy = std::function<std::string(const std::string& region)>;

/// One addressable remote object.
struct Location {
    Scheme scheme = Scheme::Https;
    std::string region;
    std::string bucket;
    std::string path;  // Absolute, e.g. "/1234/master/cache.tgz"
    HostStrategy host_strategy;

    /// Virtual-hosted-style hostname: "<bucket>.<host_strategy(region)>".
    std::string hostname() const;
};

// Hostname strategies for the supported stores
std::string s3_host(const std::string& region);
std::string gcs_host(const std::string& region);

}  // namespace dircache
