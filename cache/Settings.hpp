#pragma once

#include <config/Config.hpp>

namespace Cache {

    // fill Staleable params from configuration (current Config::Context applies):
    //   ttl = 30s
    //   max_stale = 5m
    //   refresh_workers = 2
    // not configured values are kept
    template <class Params>
    void configure(Params& aParams, const Config::Manager& aConfig)
    {
        aParams.ttl       = aConfig.duration("ttl", aParams.ttl);
        aParams.max_stale = aConfig.duration("max_stale", aParams.max_stale);
        aParams.workers   = aConfig.number<unsigned>("refresh_workers", aParams.workers);
    }
} // namespace Cache
