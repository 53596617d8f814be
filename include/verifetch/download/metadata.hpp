#pragma once

#include "destination.hpp"
#include "../network/types.hpp"

namespace verifetch {
namespace download {

// Response headers as metadata: every header under its lower-case name, plus
// "filename"/"extension" from Content-Disposition and "date" from
// Last-Modified ("YYYY-MM-DD HH:MM:SS", UTC).
Metadata extractMetadata(const network::Response& response);

}}
