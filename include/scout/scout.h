#pragma once

#include "browser/errors.hpp"
#include "browser/filter_criteria.hpp"
#include "browser/server_record.hpp"
#include "cache/cache_store.hpp"
#include "cache/cache_store_factory.hpp"
#include "catalog/catalog_client.hpp"
#include "catalog/curl_http_transport.hpp"
#include "common/clock.hpp"
#include "probe/a2s_probe_transport.hpp"
#include "probe/liveness_prober.hpp"
#include "refresh/refresh_options.hpp"
#include "refresh/refresh_orchestrator.hpp"
#include "refresh/update_stream.hpp"
