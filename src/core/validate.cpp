#include "spanwire/core/validate.hpp"

namespace spanwire::core {
    namespace {
        constexpr u32 kFieldTraceId = 1;
        constexpr u32 kFieldId = 2;
        constexpr u32 kFieldParentId = 3;
        constexpr u32 kFieldKind = 4;

        [[nodiscard]] bool kind_valid(SpanKind kind) noexcept {
            return kind == SpanKind::Unset || span_kind_name(kind) != nullptr;
        }
    } // namespace

    Status span_validate(const Span& span) noexcept {
        if (!trace_id_valid(span.trace_id)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, kFieldTraceId);
        }
        if (!span_id_valid(span.id)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, kFieldId);
        }
        if (span.parent_id.has_value() && !span_id_valid(*span.parent_id)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, kFieldParentId);
        }
        if (!kind_valid(span.kind)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid, kFieldKind);
        }
        return ok_status();
    }
} // namespace spanwire::core
