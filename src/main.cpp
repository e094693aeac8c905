#include "dircache/cache_config.hpp"
#include "dircache/directory_cache.hpp"
#include "dircache/log.hpp"
#include "dircache/shell.hpp"

#include <iostream>
#include <utility>

int main(int argc, char* argv[]) {
    auto request_opt = dircache::PlanRequest::from_args(argc, argv);
    if (!request_opt) {
        return 1;
    }
    auto request = std::move(*request_opt);
    dircache::set_verbose(request.verbose);

    auto err = request.cache.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    const auto& sc = request.cache.store_options();
    dircache::log_debug("dircache planning %s", request.phase == dircache::PlanRequest::Phase::Push ? "push" : "setup");
    dircache::log_debug("  store: %s", dircache::store_type_to_string(request.cache.store));
    dircache::log_debug("  bucket: %s", sc.bucket.c_str());
    dircache::log_debug("  region: %s", sc.region.c_str());
    dircache::log_debug("  signature-version: %s", sc.signature_version.c_str());
    dircache::log_debug("  repository: %s", request.job.repository.c_str());
    dircache::log_debug("  branch: %s", request.job.branch.c_str());
    dircache::log_debug("  pull-request: %s",
                        request.job.pull_request ? request.job.pull_request->c_str() : "(none)");
    dircache::log_debug("  directories: %zu", request.cache.directories.size());

    dircache::Script script;
    try {
        dircache::DirectoryCache cache(script,
                                       request.cache,
                                       request.job,
                                       request.slug,
                                       request.start.value_or(dircache::Clock::now()));

        const bool push = request.phase == dircache::PlanRequest::Phase::Push;
        if (push) {
            cache.fold([&cache] { cache.push(); });
        } else {
            cache.setup();
        }
        dircache::log_info("%s plan: %zu instructions, cache %s",
                           push ? "push" : "setup", script.flatten().size(),
                           cache.cache_available() ? "enabled" : "disabled");
    } catch (const dircache::SigningError& e) {
        dircache::log_error("%s", e.what());
        return 1;
    }

    std::cout << dircache::render_bash(script.instructions(), true);
    return 0;
}
