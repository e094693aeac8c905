#include "dircache/cache_config.hpp"
#include "dircache/location.hpp"
#include "dircache/signature.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace dircache {

const char* store_type_to_string(StoreType type) {
    switch (type) {
        case StoreType::S3: return "s3";
        case StoreType::Gcs: return "gcs";
    }
    return "s3";
}

std::optional<StoreType> parse_store_type(const std::string& str) {
    if (str == "s3") return StoreType::S3;
    if (str == "gcs") return StoreType::Gcs;
    return std::nullopt;
}

std::vector<std::string> missing_fields(const StoreConfig& store) {
    std::vector<std::string> missing;
    if (store.bucket.empty()) missing.push_back("bucket name");
    if (store.access_key_id.empty()) missing.push_back("access key id");
    if (store.secret_access_key.empty()) missing.push_back("secret access key");
    return missing;
}

// --- JSON helpers ---

namespace {

// Ids may arrive as numbers ("github_id": 1234) or strings.
std::string json_scalar_to_string(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    if (value.is_number_unsigned()) return std::to_string(value.get<unsigned long long>());
    if (value.is_null()) return {};
    return value.dump();
}

void parse_store(const nlohmann::json& j, StoreConfig& store) {
    if (j.contains("bucket")) store.bucket = j["bucket"].get<std::string>();
    if (j.contains("access_key_id")) store.access_key_id = j["access_key_id"].get<std::string>();
    if (j.contains("secret_access_key"))
        store.secret_access_key = j["secret_access_key"].get<std::string>();
    if (j.contains("region")) store.region = j["region"].get<std::string>();
    if (j.contains("scheme")) store.scheme = j["scheme"].get<std::string>();
    if (j.contains("signature_version"))
        store.signature_version = json_scalar_to_string(j["signature_version"]);
}

bool parse_cache(const nlohmann::json& j, CacheConfig& config) {
    if (j.contains("type")) {
        auto type = parse_store_type(j["type"].get<std::string>());
        if (!type) {
            std::cerr << "Error: unknown cache store type: " << j["type"].get<std::string>() << "\n";
            return false;
        }
        config.store = *type;
    }
    if (j.contains("s3") && j["s3"].is_object()) parse_store(j["s3"], config.s3);
    if (j.contains("gcs") && j["gcs"].is_object()) parse_store(j["gcs"], config.gcs);

    if (j.contains("fetch_timeout"))
        config.fetch_timeout = std::chrono::seconds(j["fetch_timeout"].get<long long>());
    if (j.contains("push_timeout"))
        config.push_timeout = std::chrono::seconds(j["push_timeout"].get<long long>());
    if (j.contains("branch") && !j["branch"].is_null()) config.branch = j["branch"].get<std::string>();
    if (j.contains("edge")) config.edge = j["edge"].get<bool>();
    if (j.contains("debug")) config.debug = j["debug"].get<bool>();
    if (j.contains("client_ruby")) config.client_ruby = j["client_ruby"].get<std::string>();
    if (j.contains("request_headers")) config.request_headers = j["request_headers"].get<bool>();

    // "directories" may be a single path or a list
    if (j.contains("directories")) {
        const auto& dirs = j["directories"];
        config.directories.clear();
        if (dirs.is_array()) {
            for (const auto& d : dirs) config.directories.push_back(d.get<std::string>());
        } else if (dirs.is_string()) {
            config.directories.push_back(dirs.get<std::string>());
        }
    }
    return true;
}

void parse_job(const nlohmann::json& j, JobIdentity& job) {
    if (j.contains("repository")) job.repository = json_scalar_to_string(j["repository"]);
    if (j.contains("branch")) job.branch = j["branch"].get<std::string>();
    if (j.contains("default_branch")) job.default_branch = j["default_branch"].get<std::string>();
    if (j.contains("pull_request")) {
        auto pr = json_scalar_to_string(j["pull_request"]);
        // "false" is how some CI systems spell "not a pull request"
        if (pr.empty() || pr == "false") {
            job.pull_request.reset();
        } else {
            job.pull_request = pr;
        }
    }
}

std::optional<nlohmann::json> read_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return std::nullopt;
        }
        return nlohmann::json::parse(ifs);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing " << path << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

}  // namespace

// --- CacheConfig ---

bool CacheConfig::load_json(const std::filesystem::path& path) {
    auto j = read_json(path);
    if (!j) return false;
    try {
        return parse_cache(*j, *this);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void CacheConfig::apply_defaults() {
    auto fill = [](StoreConfig& sc, const char* default_version) {
        if (sc.region.empty()) sc.region = "us-east-1";
        if (sc.scheme.empty()) sc.scheme = "https";
        if (sc.signature_version.empty()) sc.signature_version = default_version;
    };
    fill(s3, "4");
    fill(gcs, "2");
}

std::string CacheConfig::validate() const {
    const auto& sc = store_options();
    if (!sc.scheme.empty() && !parse_scheme(sc.scheme))
        return "unknown scheme for " + std::string(store_type_to_string(store)) + ": " + sc.scheme;
    if (fetch_timeout.count() <= 0) return "fetch_timeout must be > 0";
    if (push_timeout.count() <= 0) return "push_timeout must be > 0";
    if (fetch_timeout > kMaxSignedLifetime)
        return "fetch_timeout must be <= " + std::to_string(kMaxSignedLifetime.count());
    if (push_timeout > kMaxSignedLifetime)
        return "push_timeout must be <= " + std::to_string(kMaxSignedLifetime.count());
    if (branch && branch->empty()) return "casher branch override must not be empty";
    return {};
}

// --- PlanRequest ---

bool PlanRequest::load_json(const std::filesystem::path& path) {
    auto j = read_json(path);
    if (!j) return false;
    try {
        if (!parse_cache(*j, cache)) return false;
        if (j->contains("job") && (*j)["job"].is_object()) parse_job((*j)["job"], job);
        if (j->contains("slug") && !(*j)["slug"].is_null()) slug = (*j)["slug"].get<std::string>();
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

bool PlanRequest::load_job_json(const std::filesystem::path& path) {
    auto j = read_json(path);
    if (!j) return false;
    try {
        parse_job(*j, job);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing job: " << e.what() << "\n";
        return false;
    }
}

namespace {

void print_usage() {
    std::cerr <<
        "Usage: dircache --config <path> [options]\n"
        "\n"
        "Prints the shell script that installs the cache client and fetches,\n"
        "adds or pushes the job's cached directories.\n"
        "\n"
        "Input:\n"
        "  --config <path>                  JSON cache configuration (may include \"job\")\n"
        "  --job <path>                     JSON job identity\n"
        "  --phase <setup|push>             Script to emit (default: setup)\n"
        "  --slug <slug>                    Cache slug within repository/branch\n"
        "  --start <epoch-seconds>          Signing clock (default: now)\n"
        "\n"
        "Store:\n"
        "  --store <s3|gcs>                 Object store (default: s3)\n"
        "  --bucket <name>                  Bucket name\n"
        "  --region <region>                Region (default: us-east-1)\n"
        "  --scheme <http|https>            URL scheme (default: https)\n"
        "  --access-key-id <id>             Access key id (or AWS_ACCESS_KEY_ID env)\n"
        "  --secret-access-key <key>        Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --signature-version <2|4>        Request signing version\n"
        "  --request-headers                Sign v4 requests with headers instead of query\n"
        "  --fetch-timeout <secs>           Fetch URL lifetime (default: 1200)\n"
        "  --push-timeout <secs>            Push URL lifetime (default: 3600)\n"
        "\n"
        "Job:\n"
        "  --repository <id>                Repository id used as the path root\n"
        "  --branch <name>                  Branch (PR target branch for pull requests)\n"
        "  --pull-request <id>              Pull request number\n"
        "  --default-branch <name>          Default branch (default: master)\n"
        "  --directory <path>               Directory to cache (repeatable)\n"
        "\n"
        "Client:\n"
        "  --casher-branch <name>           Cache client branch override\n"
        "  --edge                           Use the edge cache client channel\n"
        "  --client-ruby <version>          Ruby for the client via rvm (empty: run directly)\n"
        "  --debug                          Verbose curl output on client download\n"
        "  --verbose                        Debug logging to stderr\n"
        "  --help                           Show this help\n";
}

bool parse_seconds(const char* value, const char* name, long long& out) {
    try {
        out = std::stoll(value);
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: " << name << " expects an integer, got: " << value << "\n";
        return false;
    }
}

}  // namespace

std::optional<PlanRequest> PlanRequest::from_args(int argc, char* argv[]) {
    PlanRequest request;

    // Store flags are applied after --config so the command line wins
    std::optional<std::string> store_flag;
    StoreConfig store_overrides;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!request.load_json(v)) return std::nullopt;
        } else if (arg == "--job") {
            auto* v = next_arg(i, "--job");
            if (!v) return std::nullopt;
            if (!request.load_job_json(v)) return std::nullopt;
        } else if (arg == "--phase") {
            auto* v = next_arg(i, "--phase");
            if (!v) return std::nullopt;
            if (std::strcmp(v, "setup") == 0) {
                request.phase = Phase::Setup;
            } else if (std::strcmp(v, "push") == 0) {
                request.phase = Phase::Push;
            } else {
                std::cerr << "Error: unknown phase: " << v << "\n";
                return std::nullopt;
            }
        } else if (arg == "--slug") {
            auto* v = next_arg(i, "--slug");
            if (!v) return std::nullopt;
            request.slug = v;
        } else if (arg == "--start") {
            auto* v = next_arg(i, "--start");
            if (!v) return std::nullopt;
            long long secs = 0;
            if (!parse_seconds(v, "--start", secs)) return std::nullopt;
            request.start = std::chrono::system_clock::time_point(std::chrono::seconds(secs));
        } else if (arg == "--store") {
            auto* v = next_arg(i, "--store");
            if (!v) return std::nullopt;
            store_flag = v;
        } else if (arg == "--bucket") {
            auto* v = next_arg(i, "--bucket");
            if (!v) return std::nullopt;
            store_overrides.bucket = v;
        } else if (arg == "--region") {
            auto* v = next_arg(i, "--region");
            if (!v) return std::nullopt;
            store_overrides.region = v;
        } else if (arg == "--scheme") {
            auto* v = next_arg(i, "--scheme");
            if (!v) return std::nullopt;
            store_overrides.scheme = v;
        } else if (arg == "--access-key-id") {
            auto* v = next_arg(i, "--access-key-id");
            if (!v) return std::nullopt;
            store_overrides.access_key_id = v;
        } else if (arg == "--secret-access-key") {
            auto* v = next_arg(i, "--secret-access-key");
            if (!v) return std::nullopt;
            store_overrides.secret_access_key = v;
        } else if (arg == "--signature-version") {
            auto* v = next_arg(i, "--signature-version");
            if (!v) return std::nullopt;
            store_overrides.signature_version = v;
        } else if (arg == "--request-headers") {
            request.cache.request_headers = true;
        } else if (arg == "--fetch-timeout") {
            auto* v = next_arg(i, "--fetch-timeout");
            if (!v) return std::nullopt;
            long long secs = 0;
            if (!parse_seconds(v, "--fetch-timeout", secs)) return std::nullopt;
            request.cache.fetch_timeout = std::chrono::seconds(secs);
        } else if (arg == "--push-timeout") {
            auto* v = next_arg(i, "--push-timeout");
            if (!v) return std::nullopt;
            long long secs = 0;
            if (!parse_seconds(v, "--push-timeout", secs)) return std::nullopt;
            request.cache.push_timeout = std::chrono::seconds(secs);
        } else if (arg == "--repository") {
            auto* v = next_arg(i, "--repository");
            if (!v) return std::nullopt;
            request.job.repository = v;
        } else if (arg == "--branch") {
            auto* v = next_arg(i, "--branch");
            if (!v) return std::nullopt;
            request.job.branch = v;
        } else if (arg == "--pull-request") {
            auto* v = next_arg(i, "--pull-request");
            if (!v) return std::nullopt;
            if (*v == '\0' || std::strcmp(v, "false") == 0) {
                request.job.pull_request.reset();
            } else {
                request.job.pull_request = v;
            }
        } else if (arg == "--default-branch") {
            auto* v = next_arg(i, "--default-branch");
            if (!v) return std::nullopt;
            request.job.default_branch = v;
        } else if (arg == "--directory") {
            auto* v = next_arg(i, "--directory");
            if (!v) return std::nullopt;
            request.cache.directories.push_back(v);
        } else if (arg == "--casher-branch") {
            auto* v = next_arg(i, "--casher-branch");
            if (!v) return std::nullopt;
            request.cache.branch = v;
        } else if (arg == "--edge") {
            request.cache.edge = true;
        } else if (arg == "--client-ruby") {
            auto* v = next_arg(i, "--client-ruby");
            if (!v) return std::nullopt;
            request.cache.client_ruby = v;
        } else if (arg == "--debug") {
            request.cache.debug = true;
        } else if (arg == "--verbose") {
            request.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (store_flag) {
        auto type = parse_store_type(*store_flag);
        if (!type) {
            std::cerr << "Error: unknown store: " << *store_flag << "\n";
            return std::nullopt;
        }
        request.cache.store = *type;
    }

    auto& sc = request.cache.store_options();
    if (!store_overrides.bucket.empty()) sc.bucket = store_overrides.bucket;
    if (!store_overrides.region.empty()) sc.region = store_overrides.region;
    if (!store_overrides.scheme.empty()) sc.scheme = store_overrides.scheme;
    if (!store_overrides.access_key_id.empty()) sc.access_key_id = store_overrides.access_key_id;
    if (!store_overrides.secret_access_key.empty())
        sc.secret_access_key = store_overrides.secret_access_key;
    if (!store_overrides.signature_version.empty())
        sc.signature_version = store_overrides.signature_version;

    // Load credentials from environment if not set on CLI or in the config file
    const bool gcs = request.cache.store == StoreType::Gcs;
    if (sc.access_key_id.empty()) {
        if (const char* v = std::getenv(gcs ? "GCS_ACCESS_KEY_ID" : "AWS_ACCESS_KEY_ID")) {
            sc.access_key_id = v;
        }
    }
    if (sc.secret_access_key.empty()) {
        if (const char* v = std::getenv(gcs ? "GCS_SECRET_ACCESS_KEY" : "AWS_SECRET_ACCESS_KEY")) {
            sc.secret_access_key = v;
        }
    }

    request.cache.apply_defaults();
    return request;
}

}  // namespace dircache
