#pragma once

#include "conduit/catalog.hpp"      // IWYU pragma: export
#include "conduit/cli.hpp"          // IWYU pragma: export
#include "conduit/config.hpp"       // IWYU pragma: export
#include "conduit/correlator.hpp"   // IWYU pragma: export
#include "conduit/format.hpp"       // IWYU pragma: export
#include "conduit/invocation.hpp"   // IWYU pragma: export
#include "conduit/protocol.hpp"     // IWYU pragma: export
#include "conduit/server.hpp"       // IWYU pragma: export
#include "conduit/session.hpp"      // IWYU pragma: export
#include "conduit/transport.hpp"    // IWYU pragma: export
#include "conduit/utils.hpp"        // IWYU pragma: export
