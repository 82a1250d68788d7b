#include "cache.h"
#include "logger.h"

namespace cache_detail {

void log_filler_failure(const char* kind, size_t index, const std::string& what){
    log_warn("cache", std::string(kind) + " #" + std::to_string(index) +
                      " failed, treating as no value: " + what);
}

void log_sweep(size_t expired_removed, bool candidate_evicted, size_t size_after){
    if(log_level() > LogLevel::Debug){
        return;
    }
    log_debug("cache", "capacity sweep removed " + std::to_string(expired_removed) +
                       " expired entr" + (expired_removed == 1 ? "y" : "ies") +
                       (candidate_evicted ? ", evicted least-recently-written entry" : "") +
                       ", size now " + std::to_string(size_after));
}

void log_background_failure(const std::string& what){
    log_error("cache", "background revalidation failed: " + what);
}

const char* missing_revalidator_message(){
    return "Cache::revalidate requires a revalidator: none configured and no override supplied";
}

} // namespace cache_detail
