#pragma once

#include <string>
#include <string_view>
#include <concepts>

#include "wiredive/core/codec/error.hpp"
#include "wiredive/core/transport/frame.hpp"


namespace wiredive::core::codec {

// -----------------------------------------------------------------------------
// CodecConcept
// -----------------------------------------------------------------------------
//
// Opaque boundary between request/response documents (JSON text) and the
// vendor-defined wire encoding.
//
//   encode(json, schema, out)   request document -> outbound frame bytes
//   decode(frame, schema, out)  inbound frame    -> JSON text
//
// Both report failures through codec::Error and never throw.
// -----------------------------------------------------------------------------
template<class C>
concept CodecConcept =
    requires(
        C codec,
        std::string_view json,
        std::string_view schema,
        const transport::Frame& frame,
        std::string& out
    )
{
    { codec.encode(json, schema, out) } noexcept -> std::same_as<Error>;
    { codec.decode(frame, schema, out) } noexcept -> std::same_as<Error>;
};

} // namespace wiredive::core::codec
