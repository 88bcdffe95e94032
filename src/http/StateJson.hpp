#pragma once

#include <vector>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "app/ConfluenceEngine.hpp"
#include "domain/Models.hpp"

namespace cfe::http {

boost::json::object to_json(const app::AnnotatedView& view);
boost::json::object to_json(const app::AnnotatedLevel& level);
boost::json::object to_json(const domain::ConfluenceState& state);
boost::json::object to_json(const app::SymbolSummary& summary);
boost::json::object to_json(const app::SymbolDetail& detail);
boost::json::object to_json(const app::BatchSummary& summary);

// Dismissed or otherwise bare level, without read-time annotations.
boost::json::object level_json(const domain::PriceLevel& level);

}  // namespace cfe::http
