#pragma once

#include "dircache/cache_config.hpp"
#include "dircache/location.hpp"
#include "dircache/shell.hpp"
#include "dircache/signature.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dircache {

/// Strip every character outside [A-Za-z0-9._-].
std::string sanitize_path_component(const std::string& component);

/// "/<repository>/<branch>/<slug><ext>" from the sanitized components.
/// Absent components, and components that sanitize to nothing, are left out
/// so the path never holds an empty segment.
std::string cache_path(const std::optional<std::string>& repository,
                       const std::optional<std::string>& branch,
                       const std::optional<std::string>& slug,
                       const std::string& ext = ".tgz");

/// Plans build-cache synchronization for one job.
///
/// Emits, through the injected Shell, the instructions that install the
/// cache client (casher), fetch the most specific cached archive available,
/// register directories for caching, and push the archive at the end of
/// the job. Nothing is executed here.
///
/// Cache problems degrade, never fail, the build:
///   - incomplete store credentials disable the cache with a warning
///   - a failed client download leaves an empty placeholder executable,
///     so the guarded client calls do nothing at run time
/// The only hard error is SigningError from the signer.
///
/// One signing strategy is bound at construction from the store's signature
/// version, and every URL is signed against the `start` instant captured
/// then. With request headers enabled, SigV4 signs the push in header mode;
/// fetch candidates stay presigned so each one authenticates on its own.
class DirectoryCache {
public:
    /// Maximum number of directories passed to one `casher add`.
    static constexpr size_t kAddDirMax = 100;

    static constexpr const char* kCasherDir = "$HOME/.casher";
    static constexpr const char* kBinPath = "$CASHER_DIR/bin/casher";

    DirectoryCache(Shell& sh,
                   CacheConfig config,
                   JobIdentity job,
                   std::optional<std::string> slug = std::nullopt,
                   Clock::time_point start = Clock::now());

    DirectoryCache(const DirectoryCache&) = delete;
    DirectoryCache& operator=(const DirectoryCache&) = delete;

    /// Run validation; true when no required field is missing. Also decides
    /// cache_available(), so a later install() does not warn again.
    bool valid();

    /// Reset and refill the diagnostics; warn through the shell when any
    /// required field is missing.
    const std::vector<std::string>& validate();

    const std::vector<std::string>& msgs() const { return msgs_; }

    // --- Plan emitters ---

    /// install(), fetch() and, when directories are configured, add(),
    /// inside one fold.
    void setup();

    /// Download the cache client. A failed download writes an empty
    /// placeholder instead of failing the job.
    void install();

    /// Fetch the first existing archive of the fallback cascade.
    void fetch();

    /// Upload the current group's archive. Returns false when nothing was
    /// scheduled because the cache is unavailable or the job has no branch;
    /// upload failures at run time are not reported.
    bool push();

    /// Register directories for caching, at most kAddDirMax per call.
    void add(const std::vector<std::string>& paths);

    /// Group instructions under the next "cache.N" section.
    void fold(const std::string& message, const Shell::Block& block);
    void fold(const Shell::Block& block) { fold(std::string(), block); }

    // --- URL construction ---

    /// Shell-escaped, signed GET URLs, most specific first.
    std::vector<std::string> fetch_urls() const;

    std::string fetch_url(const std::string& branch, const std::string& ext = ".tbz") const;
    std::string fetch_url() const { return fetch_url(group()); }
    std::string push_url(const std::string& branch) const;
    std::string push_url() const { return push_url(group()); }

    SignedRequest signature(const std::string& verb,
                            const std::string& path,
                            std::chrono::seconds expires) const;

    std::string prefixed(const std::string& branch, const std::string& ext = ".tgz") const;

    /// "PR.<id>" for pull requests, the branch otherwise.
    std::string group() const;

    std::string casher_branch() const;
    std::string casher_url() const;

    /// Decided once, by install() or by the first cache operation.
    bool cache_available();

    const Signer& signer() const { return *signer_; }
    /// Signer for the push; differs from signer() only in header mode.
    const Signer& push_signer() const { return push_signer_ ? *push_signer_ : *signer_; }
    Clock::time_point start() const { return start_; }
    const CacheConfig& config() const { return config_; }
    const JobIdentity& job() const { return job_; }

private:
    Shell& sh_;
    const CacheConfig config_;
    const JobIdentity job_;
    const std::optional<std::string> slug_;
    const Clock::time_point start_;
    const KeyPair key_pair_;
    const std::unique_ptr<const Signer> signer_;
    const std::unique_ptr<const Signer> push_signer_;  // Header mode only

    std::vector<std::string> msgs_;
    int fold_count_ = 0;
    std::optional<bool> available_;

    Location location(const std::string& path) const;
    std::vector<SignedRequest> fetch_requests() const;
    SignedRequest push_request(const std::string& branch) const;
    SignedRequest sign(const Signer& signer,
                       const std::string& verb,
                       const std::string& path,
                       std::chrono::seconds expires) const;
    std::string debug_flags() const;

    void run(const std::string& command,
             const std::vector<std::string>& args,
             CmdOptions options,
             const SignedRequest* request = nullptr);
};

}  // namespace dircache
