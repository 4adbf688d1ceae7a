#pragma once

#include <string>
#include <type_traits>

#include "kairos/core/errors.hpp"
#include "kairos/core/types.hpp"

namespace kairos::temporal {
    class TimelineService;
}

namespace kairos::bindings::http {
    using u8 = kairos::core::u8;
    using u16 = kairos::core::u16;
    using u32 = kairos::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct HttpHeader {
        BufferView name{};
        BufferView value{};
    };

    // path may carry a query string ("/temporal_sequence/3?limit=5").
    struct HttpRequest {
        BufferView method{};
        BufferView path{};
        BufferView body{};
        const HttpHeader* headers{nullptr};
        u32 header_count{0};
    };

    struct HttpResponse {
        u16 status{200};
        std::string body;   // JSON
    };

    [[nodiscard]] BufferView view_of(const char* s) noexcept;

    // Maps a failed status onto an HTTP code: NotFound 404, validation
    // errors 400, Conflict 409, Busy/Unavailable 503, everything else 500.
    [[nodiscard]] u16 http_status_for(kairos::core::Status s) noexcept;

    // Routes one request onto the timeline operations. The response is
    // always filled in; the returned status is the operation's own.
    kairos::core::Status handle_http_request(kairos::temporal::TimelineService& service,
                                             const HttpRequest& req, HttpResponse* out) noexcept;

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<HttpHeader>);
    static_assert(std::is_trivially_copyable_v<HttpRequest>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_standard_layout_v<HttpRequest>);

} // namespace kairos::bindings::http
