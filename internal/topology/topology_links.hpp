#pragma once

#include "internal/model/session.hpp"
#include "internal/model/topology.hpp"

namespace blueshare::topology {

/*
  Builds the undirected adjacency for a chosen topology.

    star    every non-host links to the first host
    bus     devices chained in session order
    mesh    hosts fully interconnected, non-hosts spread round-robin over hosts
    hybrid  every non-host links to the first host, relays also link each other

  Every device appears as a key, even without links.
*/
blueshare::model::TopologyLinks BuildLinks(const blueshare::model::Session& session, blueshare::model::Topology topology);

} // namespace blueshare::topology
