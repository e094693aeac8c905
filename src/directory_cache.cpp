#include "dircache/directory_cache.hpp"
#include "dircache/log.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace dircache {

namespace {

const char* const kConfigMissing = "Worker %s config missing: %s";
const char* const kCasherUrl = "https://raw.githubusercontent.com/travis-ci/casher/%s/bin/casher";

const char* const kCurlFormat =
    "             time_namelookup:  %{time_namelookup} s\n"
    "                time_connect:  %{time_connect} s\n"
    "             time_appconnect:  %{time_appconnect} s\n"
    "            time_pretransfer:  %{time_pretransfer} s\n"
    "               time_redirect:  %{time_redirect} s\n"
    "          time_starttransfer:  %{time_starttransfer} s\n"
    "              speed_download:  %{speed_download} bytes/s\n"
    "               url_effective:  %{url_effective}\n"
    "                             ----------\n"
    "                  time_total:  %{time_total} s\n";

std::string replace_first(std::string text, const std::string& token, const std::string& value) {
    auto pos = text.find(token);
    if (pos != std::string::npos) text.replace(pos, token.size(), value);
    return text;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string upcase(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

// Never put credentials in the log
std::string mask(const std::string& value) {
    return value.empty() ? "(unset)" : "****";
}

}  // namespace

// ============================================================================
// Paths
// ============================================================================

std::string sanitize_path_component(const std::string& component) {
    std::string out;
    out.reserve(component.size());
    for (unsigned char c : component) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            out += static_cast<char>(c);
        }
    }
    return out;
}

std::string cache_path(const std::optional<std::string>& repository,
                       const std::optional<std::string>& branch,
                       const std::optional<std::string>& slug,
                       const std::string& ext) {
    std::vector<std::string> parts;
    for (const auto* component : {&repository, &branch, &slug}) {
        if (!component->has_value()) continue;
        auto clean = sanitize_path_component(**component);
        if (!clean.empty()) parts.push_back(std::move(clean));
    }
    return "/" + join(parts, "/") + ext;
}

// ============================================================================
// DirectoryCache
// ============================================================================

DirectoryCache::DirectoryCache(Shell& sh,
                               CacheConfig config,
                               JobIdentity job,
                               std::optional<std::string> slug,
                               Clock::time_point start)
    : sh_(sh)
    , config_(std::move(config))
    , job_(std::move(job))
    , slug_(std::move(slug))
    , start_(start)
    , key_pair_{config_.store_options().access_key_id, config_.store_options().secret_access_key}
    , signer_(make_signer(config_.store_options().signature_version))
    , push_signer_(config_.request_headers
                       ? make_signer(config_.store_options().signature_version, true)
                       : nullptr) {}

bool DirectoryCache::valid() {
    validate();
    available_ = msgs_.empty();
    return *available_;
}

const std::vector<std::string>& DirectoryCache::validate() {
    const auto& sc = config_.store_options();
    log_debug("%s store options: bucket=%s region=%s scheme=%s signature_version=%s "
              "access_key_id=%s secret_access_key=%s",
              store_type_to_string(config_.store), sc.bucket.c_str(), sc.region.c_str(),
              sc.scheme.c_str(), sc.signature_version.c_str(),
              mask(sc.access_key_id).c_str(), mask(sc.secret_access_key).c_str());

    msgs_ = missing_fields(sc);
    if (!msgs_.empty()) {
        std::string store = upcase(store_type_to_string(config_.store));
        std::string missing = join(msgs_, ", ");
        sh_.echo(replace_first(replace_first(kConfigMissing, "%s", store), "%s", missing), Ansi::Red);
        log_warn("%s cache disabled, config missing: %s", store.c_str(), missing.c_str());
    }
    return msgs_;
}

bool DirectoryCache::cache_available() {
    if (!available_) available_ = valid();
    return *available_;
}

void DirectoryCache::setup() {
    fold("Setting up build cache", [this] {
        install();
        fetch();
        if (config_.caches_directories()) add(config_.directories);
    });
}

void DirectoryCache::install() {
    sh_.export_var("CASHER_DIR", kCasherDir);

    FileOptions mkdir_opts;
    mkdir_opts.echo = false;
    mkdir_opts.recursive = true;
    sh_.mkdir("$CASHER_DIR/bin", mkdir_opts);

    if (!cache_available()) {
        // Leave a placeholder so later stages see the cache as installed-but-inert
        sh_.raw(std::string("echo > ") + kBinPath);
        return;
    }

    std::string curl = "curl " + casher_url();
    auto flags = debug_flags();
    if (!flags.empty()) curl += " " + flags;
    curl += std::string(" -L -o ") + kBinPath + " -s --fail";

    CmdOptions download;
    download.retry = true;
    download.echo_text = "Installing caching utilities";
    sh_.cmd(curl, download);
    sh_.raw(std::string("[ $? -ne 0 ] && echo 'Failed to fetch casher from GitHub, disabling cache.' && echo > ") +
            kBinPath);

    sh_.if_then(std::string("-f ") + kBinPath, [this] {
        FileOptions chmod_opts;
        chmod_opts.echo = false;
        chmod_opts.assert_ok = false;
        sh_.chmod("+x", kBinPath, chmod_opts);
    });
}

void DirectoryCache::fetch() {
    if (!cache_available()) {
        log_debug("cache unavailable, skipping fetch");
        return;
    }
    auto requests = fetch_requests();
    if (requests.empty()) {
        log_warn("no branch to fetch the cache for, skipping fetch");
        return;
    }
    std::vector<std::string> urls;
    urls.reserve(requests.size());
    for (const auto& r : requests) urls.push_back(shell_escape(r.uri));

    CmdOptions options;
    options.timing = true;
    run("fetch", urls, options);
}

bool DirectoryCache::push() {
    if (!cache_available()) {
        log_debug("cache unavailable, skipping push");
        return false;
    }
    if (sanitize_path_component(group()).empty()) {
        log_warn("no branch to push the cache for, skipping push");
        return false;
    }
    auto request = push_request(group());

    CmdOptions options;
    options.assert_ok = false;
    options.timing = true;
    run("push", {shell_escape(request.uri)}, options, &request);
    return true;
}

void DirectoryCache::add(const std::vector<std::string>& paths) {
    if (paths.empty()) return;
    if (!cache_available()) {
        log_debug("cache unavailable, skipping add of %zu directories", paths.size());
        return;
    }
    for (size_t begin = 0; begin < paths.size(); begin += kAddDirMax) {
        size_t end = std::min(paths.size(), begin + kAddDirMax);
        std::vector<std::string> batch(paths.begin() + begin, paths.begin() + end);
        run("add", batch, CmdOptions{});
    }
}

void DirectoryCache::fold(const std::string& message, const Shell::Block& block) {
    ++fold_count_;
    sh_.fold("cache." + std::to_string(fold_count_), [&] {
        if (!message.empty()) sh_.echo(message);
        if (block) block();
    });
}

std::vector<SignedRequest> DirectoryCache::fetch_requests() const {
    std::vector<std::string> branches = {group()};
    if (job_.is_pull_request()) branches.push_back(job_.branch);
    if (!job_.is_default_branch()) branches.push_back(job_.default_branch);

    std::vector<SignedRequest> requests;
    requests.reserve(branches.size() * 2);
    for (const auto& branch : branches) {
        // An empty branch would collapse onto the repository-level archive
        if (sanitize_path_component(branch).empty()) continue;
        requests.push_back(signature("GET", prefixed(branch, ".tgz"), config_.fetch_timeout));
        requests.push_back(signature("GET", prefixed(branch, ".tbz"), config_.fetch_timeout));
    }
    return requests;
}

std::vector<std::string> DirectoryCache::fetch_urls() const {
    std::vector<std::string> urls;
    for (const auto& r : fetch_requests()) urls.push_back(shell_escape(r.uri));
    return urls;
}

std::string DirectoryCache::fetch_url(const std::string& branch, const std::string& ext) const {
    return signature("GET", prefixed(branch, ext), config_.fetch_timeout).uri;
}

std::string DirectoryCache::push_url(const std::string& branch) const {
    return push_request(branch).uri;
}

SignedRequest DirectoryCache::push_request(const std::string& branch) const {
    return sign(push_signer_ ? *push_signer_ : *signer_, "PUT", prefixed(branch, ".tgz"),
                config_.push_timeout);
}

SignedRequest DirectoryCache::signature(const std::string& verb,
                                        const std::string& path,
                                        std::chrono::seconds expires) const {
    return sign(*signer_, verb, path, expires);
}

SignedRequest DirectoryCache::sign(const Signer& signer,
                                   const std::string& verb,
                                   const std::string& path,
                                   std::chrono::seconds expires) const {
    // Checked before the addition: a huge lifetime overflows the clock
    if (expires > kMaxSignedLifetime)
        throw SigningError("cannot sign request: lifetime " + std::to_string(expires.count()) +
                           "s exceeds " + std::to_string(kMaxSignedLifetime.count()) + "s");
    return signer.sign(key_pair_, verb, location(path), start_ + expires, start_);
}

std::string DirectoryCache::prefixed(const std::string& branch, const std::string& ext) const {
    std::optional<std::string> repository;
    if (!job_.repository.empty()) repository = job_.repository;
    return cache_path(repository, branch, slug_, ext);
}

std::string DirectoryCache::group() const {
    return job_.is_pull_request() ? "PR." + *job_.pull_request : job_.branch;
}

std::string DirectoryCache::casher_branch() const {
    if (config_.branch) return *config_.branch;
    return config_.edge ? "master" : "production";
}

std::string DirectoryCache::casher_url() const {
    return replace_first(kCasherUrl, "%s", casher_branch());
}

Location DirectoryCache::location(const std::string& path) const {
    const auto& sc = config_.store_options();
    Location loc;
    loc.scheme = parse_scheme(sc.scheme).value_or(Scheme::Https);
    loc.region = sc.region.empty() ? "us-east-1" : sc.region;
    loc.bucket = sc.bucket;
    loc.path = path;
    loc.host_strategy = config_.store == StoreType::Gcs ? HostStrategy(gcs_host) : HostStrategy(s3_host);
    return loc;
}

std::string DirectoryCache::debug_flags() const {
    if (!config_.debug) return {};
    return std::string("-v -w '") + kCurlFormat + "'";
}

void DirectoryCache::run(const std::string& command,
                         const std::vector<std::string>& args,
                         CmdOptions options,
                         const SignedRequest* request) {
    CmdOptions quiet;
    quiet.echo = false;
    quiet.assert_ok = false;

    // Header-signed request: the client reads curl headers from a file,
    // which holds the headers of exactly one request.
    if (request && !request->headers.empty()) {
        sh_.cmd("cat /dev/null > $HOME/curl_headers", quiet);
        for (const auto& [name, value] : request->headers) {
            sh_.cmd("echo " + shell_escape("header=\"" + name + ": " + value + "\"") +
                        " >> $HOME/curl_headers",
                    quiet);
        }
    }

    options.echo = false;
    options.assert_ok = false;

    std::string invocation = std::string(kBinPath) + " " + command;
    if (!args.empty()) invocation += " " + join(args, " ");

    sh_.if_then(std::string("-f ") + kBinPath, [&] {
        if (config_.client_ruby.empty()) {
            sh_.cmd(invocation, options);
            return;
        }
        sh_.cmd("type rvm &>/dev/null || source ~/.rvm/scripts/rvm", quiet);
        sh_.cmd("rvm " + config_.client_ruby + " --fuzzy do " + invocation, options);
    });
}

}  // namespace dircache
