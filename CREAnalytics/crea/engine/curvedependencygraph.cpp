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

/*! \file crea/engine/curvedependencygraph.cpp
    \brief Dependency graph of the curves of a group
    \ingroup engine
*/

#include <crea/engine/curvedependencygraph.hpp>

#include <cred/utilities/log.hpp>

#include <cve/utilities/calibrationerror.hpp>

#include <boost/graph/tiernan_all_cycles.hpp>
#include <boost/graph/topological_sort.hpp>

#include <algorithm>
#include <iterator>
#include <sstream>
#include <tuple>

using namespace cre::data;
using CurveExt::CyclicCurveDependencyError;
using CurveExt::InvalidCurveNodeError;
using CurveExt::RatesCurveProvider;
using std::set;
using std::string;
using std::vector;

namespace cre {
namespace analytics {

namespace {
struct CycleInserter {
    explicit CycleInserter(vector<vector<string>>& cycles) : cycles_(cycles) {}
    template <typename Path, typename Graph> void cycle(const Path& p, const Graph& g) {
        cycles_.push_back({});
        typename Path::const_iterator i, end = p.end();
        for (i = p.begin(); i != end; ++i) {
            cycles_.back().push_back(g[*i].curveName);
        }
    }
    vector<vector<string>>& cycles_;
};
} // namespace

CurveDependencyGraph::CurveDependencyGraph(const CurveGroupDefinition& group,
                                           const std::map<string, CurveRequirements>& requirements,
                                           const RatesCurveProvider& seeds) {
    DLOG("Build dependency graph for curve group " << group.name());
    buildGraph(group, requirements, seeds);
    checkCycles();
    buildLayers();
}

void CurveDependencyGraph::buildGraph(const CurveGroupDefinition& group,
                                      const std::map<string, CurveRequirements>& requirements,
                                      const RatesCurveProvider& seeds) {

    // add the vertices

    std::map<string, string> discountCurves, indexCurves;
    for (std::size_t i = 0; i < group.curveDefinitions().size(); ++i) {
        const string& name = group.curveDefinitions()[i].name();
        if (seeds.hasCurve(name))
            throw InvalidCurveNodeError("curve " + name + " of group " + group.name() +
                                        " is also given as a seed curve");
        Vertex v = boost::add_vertex(graph_);
        graph_[v] = Node{i, name, {}};
        vertices_[name] = v;
        TLOG("add vertex #" << i << ": " << graph_[v]);

        CurveGroupEntry entry = group.entry(name);
        for (auto const& ccy : entry.discountCurrencies) {
            if (seeds.discountCurveName(ccy))
                throw InvalidCurveNodeError("currency " + ccy + " is discounted by curve " + name + " of group " +
                                            group.name() + " and by seed curve " + *seeds.discountCurveName(ccy));
            discountCurves[ccy] = name;
        }
        for (auto const& index : entry.indices) {
            if (seeds.indexCurveName(index))
                throw InvalidCurveNodeError("index " + index + " is projected by curve " + name + " of group " +
                                            group.name() + " and by seed curve " + *seeds.indexCurveName(index));
            indexCurves[index] = name;
        }
    }

    // add the edges

    set<std::pair<string, string>> edges;
    auto addDependency = [this, &edges, &seeds](const string& curve, const boost::optional<string>& groupCurve,
                                                const boost::optional<string>& seedCurve, const string& what) {
        if (groupCurve) {
            if (*groupCurve != curve && edges.insert(std::make_pair(*groupCurve, curve)).second) {
                graph_.add_edge(vertices_.at(*groupCurve), vertices_.at(curve));
                TLOG("add edge from " << *groupCurve << " to " << curve);
            }
        } else if (seedCurve) {
            graph_[vertices_.at(curve)].seedDependencies.insert(*seedCurve);
        } else {
            throw InvalidCurveNodeError("curve " + curve + " requires " + what +
                                        " which is neither provided by the group nor by a seed curve");
        }
    };

    for (auto const& c : group.curveDefinitions()) {
        auto r = requirements.find(c.name());
        if (r == requirements.end())
            continue;
        for (auto const& ccy : r->second.discountCurrencies) {
            auto it = discountCurves.find(ccy);
            addDependency(c.name(), it == discountCurves.end() ? boost::none : boost::optional<string>(it->second),
                          seeds.discountCurveName(ccy), "a discount curve for currency " + ccy);
        }
        for (auto const& index : r->second.indices) {
            auto it = indexCurves.find(index);
            addDependency(c.name(), it == indexCurves.end() ? boost::none : boost::optional<string>(it->second),
                          seeds.indexCurveName(index), "a forwarding curve for index " + index);
        }
    }

    DLOG("Dependency graph built with " << boost::num_vertices(graph_) << " vertices, " << boost::num_edges(graph_)
                                        << " edges.");
}

void CurveDependencyGraph::checkCycles() const {
    vector<vector<string>> cycles;
    boost::tiernan_all_cycles(graph_, CycleInserter(cycles));
    DLOG("Identified " << cycles.size() << " cycles in dependency graph.");
    if (cycles.empty())
        return;
    std::ostringstream out;
    out << "cyclic dependency between curves";
    for (auto const& c : cycles) {
        out << " [";
        for (std::size_t i = 0; i < c.size(); ++i)
            out << (i == 0 ? "" : " -> ") << c[i];
        out << "]";
    }
    throw CyclicCurveDependencyError(out.str());
}

void CurveDependencyGraph::buildLayers() {
    // reverse topological order
    vector<Vertex> order;
    boost::topological_sort(graph_, std::back_inserter(order));

    std::map<std::size_t, std::size_t> layer;
    std::size_t maxLayer = 0;
    for (auto v = order.rbegin(); v != order.rend(); ++v) {
        std::size_t l = 0;
        boost::graph_traits<Graph>::in_edge_iterator e, eend;
        for (std::tie(e, eend) = boost::in_edges(*v, graph_); e != eend; ++e)
            l = std::max(l, layer.at(graph_[boost::source(*e, graph_)].index) + 1);
        layer[graph_[*v].index] = l;
        maxLayer = std::max(maxLayer, l);
    }

    // curves within a layer in the order of the group definition
    vector<std::pair<std::size_t, string>> curves;
    VertexIterator v, vend;
    for (std::tie(v, vend) = boost::vertices(graph_); v != vend; ++v)
        curves.push_back(std::make_pair(graph_[*v].index, graph_[*v].curveName));
    std::sort(curves.begin(), curves.end());

    layers_ = vector<vector<string>>(curves.empty() ? 0 : maxLayer + 1);
    for (auto const& c : curves)
        layers_[layer.at(c.first)].push_back(c.second);

    for (std::size_t i = 0; i < layers_.size(); ++i) {
        std::ostringstream out;
        for (auto const& c : layers_[i])
            out << c << " ";
        DLOG("layer #" << i << ": " << out.str());
    }
}

set<string> CurveDependencyGraph::dependencies(const string& curveName) const {
    auto it = vertices_.find(curveName);
    QL_REQUIRE(it != vertices_.end(), "CurveDependencyGraph: curve " << curveName << " not found");
    set<string> result;
    boost::graph_traits<Graph>::in_edge_iterator e, eend;
    for (std::tie(e, eend) = boost::in_edges(it->second, graph_); e != eend; ++e)
        result.insert(graph_[boost::source(*e, graph_)].curveName);
    return result;
}

const set<string>& CurveDependencyGraph::seedDependencies(const string& curveName) const {
    auto it = vertices_.find(curveName);
    QL_REQUIRE(it != vertices_.end(), "CurveDependencyGraph: curve " << curveName << " not found");
    return graph_[it->second].seedDependencies;
}

std::ostream& operator<<(std::ostream& o, const CurveDependencyGraph::Node& n) {
    return o << n.curveName << "(" << n.index << ")";
}

} // namespace analytics
} // namespace cre
