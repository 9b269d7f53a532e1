#pragma once

#include "signalhub/version.hpp"
#include "signalhub/logger.h"

#include "signalhub/hub.hpp"
#include "signalhub/mirror/mirror_store.hpp"
#include "signalhub/mirror/redis_mirror.hpp"
#include "signalhub/mirror/write_behind_mirror.hpp"

#ifdef SIGNALHUB_WITH_SERVER
    #include "signalhub/monitoring/relay_metrics.hpp"
    #include "signalhub/server/event_gateway.hpp"
    #include "signalhub/server/http_api.hpp"
    #include "signalhub/server/listener.hpp"
    #include "signalhub/server/server_config.hpp"
    #include "signalhub/server/ws_transport.hpp"
#endif
