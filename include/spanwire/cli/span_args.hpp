#pragma once

#include <vector>

#include "spanwire/cli/options.hpp"
#include "spanwire/core/errors.hpp"
#include "spanwire/core/models.hpp"

namespace spanwire::cli {
    // What `encode` and `size` act on, assembled from their options.
    struct EncodeRequest {
        spanwire::core::Span span;
        bool as_list{false};
        u64 repeat{1};
        const char* output{nullptr};
        bool verbose{false};
    };

    // Option table shared by `encode` and `size`.
    [[nodiscard]] const OptionSpec* span_option_specs(u32* count) noexcept;

    // Maps parsed options onto a request. default_service (may be null) names
    // the local endpoint when --local-service is absent. On failure aux holds
    // the index of the offending option in opts.
    //
    // Does not check id formats; see spanwire::core::span_validate.
    [[nodiscard]] spanwire::core::Status span_request_from_options(const ParsedOptions& opts,
        const char* default_service,
        EncodeRequest* out);

    // The spans a list request encodes: req.repeat copies of req.span.
    // Cli/OutOfMemory if they cannot be allocated; *out is then empty.
    [[nodiscard]] spanwire::core::Status span_request_list(const EncodeRequest& req,
        std::vector<spanwire::core::Span>* out);

} // namespace spanwire::cli
