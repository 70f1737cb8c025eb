#pragma once

#include "anchordrop/ledger.hpp"

#include <glaze/glaze.hpp>

namespace glz {

    template <>
    struct meta<anchordrop::anchor_entry> {
        using T = anchordrop::anchor_entry;
        static constexpr auto value =
                object("key",
                       &T::key,
                       "path",
                       &T::path,
                       "line",
                       &T::line,
                       "kind",
                       &T::kind,
                       "description",
                       &T::description,
                       "status",
                       &T::status,
                       "created",
                       &T::created);
    };

    template <>
    struct meta<anchordrop::anchors_record> {
        using T = anchordrop::anchors_record;
        static constexpr auto value = object("version", &T::version, "generated", &T::generated, "anchors", &T::anchors);
    };

}  // namespace glz

namespace anchordrop::internal {

    // Unknown keys pass; every declared field is required.
    inline constexpr glz::opts ledger_read_opts{.error_on_unknown_keys = false, .error_on_missing_keys = true};

    inline constexpr glz::opts ledger_write_opts{.prettify = true};

}  // namespace anchordrop::internal
