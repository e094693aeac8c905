#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dircache {

enum class StoreType {
    S3,
    Gcs
};

const char* store_type_to_string(StoreType type);  // "s3", "gcs"
std::optional<StoreType> parse_store_type(const std::string& str);

/// Credentials and addressing for one object store.
struct StoreConfig {
    std::string bucket;
    std::string access_key_id;
    std::string secret_access_key;
    std::string region;             // Default: us-east-1
    std::string scheme;             // "http" or "https" (default)
    std::string signature_version;  // "2" or "4"; anything else means "4"
};

/// Labels of the required fields missing from `store`, in the fixed order
/// bucket, access key id, secret access key. Empty when complete.
std::vector<std::string> missing_fields(const StoreConfig& store);

/// Identity of the CI job whose cache is being planned.
struct JobIdentity {
    std::string repository;                   // Repository id or slug
    std::string branch;                       // Branch, or PR target branch
    std::optional<std::string> pull_request;  // PR number when building a PR
    std::string default_branch = "master";

    bool is_pull_request() const { return pull_request.has_value() && !pull_request->empty(); }
    bool is_default_branch() const { return branch == default_branch; }
};

/// Cache options for one job. Read-only once handed to DirectoryCache.
struct CacheConfig {
    StoreType store = StoreType::S3;
    StoreConfig s3;
    StoreConfig gcs;

    // Signature lifetimes, at most kMaxSignedLifetime
    std::chrono::seconds fetch_timeout{20 * 60};
    std::chrono::seconds push_timeout{60 * 60};

    // Cache client installation
    std::optional<std::string> branch;  // Explicit casher branch
    bool edge = false;                  // Use the edge (master) channel
    bool debug = false;                 // Verbose curl diagnostics on install
    std::string client_ruby = "1.9.3";  // Ruby selected via rvm; empty runs the client directly

    // Sign with v4 headers and hand them to the client through $HOME/curl_headers
    bool request_headers = false;

    std::vector<std::string> directories;

    const StoreConfig& store_options() const { return store == StoreType::Gcs ? gcs : s3; }
    StoreConfig& store_options() { return store == StoreType::Gcs ? gcs : s3; }

    bool caches_directories() const { return !directories.empty(); }

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill region, scheme and per-store signature version defaults.
    void apply_defaults();

    /// Validate structural settings. Returns error message or empty string.
    /// Missing credentials are not an error here: they disable the cache.
    std::string validate() const;
};

/// Everything the dircache tool needs for one run.
struct PlanRequest {
    enum class Phase {
        Setup,
        Push
    };

    CacheConfig cache;
    JobIdentity job;
    std::optional<std::string> slug;
    Phase phase = Phase::Setup;
    std::optional<std::chrono::system_clock::time_point> start;  // Signing clock override
    bool verbose = false;

    /// Parse command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<PlanRequest> from_args(int argc, char* argv[]);

    /// Load "job"/"slug" plus all cache options from a JSON file.
    bool load_json(const std::filesystem::path& path);

    /// Load a JSON file whose root object is the job identity.
    bool load_job_json(const std::filesystem::path& path);
};

}  // namespace dircache
