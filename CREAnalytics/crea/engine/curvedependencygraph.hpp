/*
 Copyright (C) 2026 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of CRE, a free-software/open-source library
 for multi-curve calibration and market quote risk analysis

 CRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file crea/engine/curvedependencygraph.hpp
    \brief Dependency graph of the curves of a group, establishes the calibration order
    \ingroup engine
*/

#pragma once

#include <cred/configuration/curvedefinition.hpp>

#include <cve/termstructures/ratescurveprovider.hpp>

#include <boost/graph/directed_graph.hpp>
#include <boost/graph/graph_traits.hpp>

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace cre {
namespace analytics {

//! Currencies and indices the instruments of a curve need
struct CurveRequirements {
    std::set<std::string> discountCurrencies;
    std::set<std::string> indices;
};

//! Dependency graph of the curves of a group
/*! A vertex represents a curve of the group, an edge from x to y means that x must be
    calibrated before or together with y since instruments of y are priced on x. The curves a
    curve depends on are found from the currencies and indices its instruments need, via the
    group entries or the seed curves. A curve depending on itself is fine, a dependency that is
    neither in the group nor a seed curve raises an InvalidCurveNodeError, a cycle between
    distinct curves raises a CyclicCurveDependencyError.

    The curves are arranged in layers: a curve is in layer 0 if it only depends on itself and on
    seed curves, otherwise its layer is one plus the highest layer of the curves it depends on.
    The curves of a layer are calibrated jointly, in the order of the group definition.

    \ingroup engine
*/
class CurveDependencyGraph {
public:
    //! data structure for a vertex in the graph
    struct Node {
        std::size_t index;     // position of the curve in the group definition
        std::string curveName; // the curve to calibrate
        std::set<std::string> seedDependencies;
    };

    using Graph = boost::directed_graph<Node>;
    using Vertex = boost::graph_traits<Graph>::vertex_descriptor;
    using VertexIterator = boost::graph_traits<Graph>::vertex_iterator;

    CurveDependencyGraph(const data::CurveGroupDefinition& group,
                         const std::map<std::string, CurveRequirements>& requirements,
                         const CurveExt::RatesCurveProvider& seeds);

    //! curve names per layer, in calibration order
    const std::vector<std::vector<std::string>>& layers() const { return layers_; }
    //! curves of the group the given curve depends on, excluding itself
    std::set<std::string> dependencies(const std::string& curveName) const;
    //! seed curves the given curve depends on
    const std::set<std::string>& seedDependencies(const std::string& curveName) const;
    const Graph& graph() const { return graph_; }

private:
    void buildGraph(const data::CurveGroupDefinition& group,
                    const std::map<std::string, CurveRequirements>& requirements,
                    const CurveExt::RatesCurveProvider& seeds);
    void checkCycles() const;
    void buildLayers();

    Graph graph_;
    std::map<std::string, Vertex> vertices_;
    std::vector<std::vector<std::string>> layers_;
};

std::ostream& operator<<(std::ostream& o, const CurveDependencyGraph::Node& n);

} // namespace analytics
} // namespace cre
