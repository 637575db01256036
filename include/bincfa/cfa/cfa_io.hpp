#pragma once

/*
 * Persistence and text dump of a CFA.
 *
 * The binary file is a boost binary archive containing the graph
 * (number of states, the states, number of edges, the edges as pairs
 * of ids) followed by the last id issued by the allocator of the
 * CFA. There is no version besides the archive header.
 */

#include <bincfa/cfa/cfa.hpp>
#include <bincfa/support/debug.hpp>
#include <bincfa/support/os.hpp>
#include <bincfa/support/stats.hpp>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/utility.hpp>
#include <exception>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace bincfa {
namespace cfa {

template <class Domain>
void marshal(const std::string &path, const cfa<Domain> &g) {
  BINCFA_SCOPED_STATS("CFA.marshal", 1);
  using state_t = typename cfa<Domain>::state_t;
  using edge_t = typename cfa<Domain>::edge_t;

  std::ofstream ofs(path.c_str(), std::ios::out | std::ios::binary);
  if (!ofs) {
    BINCFA_ERROR("cannot open ", path, " for writing");
  }
  std::vector<state_id_t> vertices = g.ids();
  std::vector<edge_t> edges = g.edges();
  try {
    boost::archive::binary_oarchive oa(ofs);
    std::size_t num_states = vertices.size();
    oa << num_states;
    for (state_id_t id : vertices) {
      const state_t &s = g.get_node(id);
      oa << s;
    }
    std::size_t num_edges = edges.size();
    oa << num_edges;
    for (auto const &e : edges) {
      oa << e;
    }
    state_id_t counter = g.id_allocator().current();
    oa << counter;
  } catch (boost::archive::archive_exception &e) {
    BINCFA_ERROR("cannot marshal the CFA into ", path, ": ", e.what());
  }
  ofs.close();
  if (!ofs) {
    BINCFA_ERROR("error while writing ", path);
  }
  BINCFA_LOG("cfa-io", outs() << "marshaled " << vertices.size()
                              << " states and " << edges.size()
                              << " edges into " << path << "\n";);
}

// Return the CFA stored in path. Its allocator continues the numbering
// of the persisted one.
template <class Domain>
std::unique_ptr<cfa<Domain>> unmarshal(const std::string &path) {
  BINCFA_SCOPED_STATS("CFA.unmarshal", 1);
  using state_t = typename cfa<Domain>::state_t;
  using edge_t = typename cfa<Domain>::edge_t;

  std::ifstream ifs(path.c_str(), std::ios::in | std::ios::binary);
  if (!ifs) {
    BINCFA_ERROR("cannot open ", path, " for reading");
  }
  std::unique_ptr<cfa<Domain>> g(new cfa<Domain>());
  try {
    boost::archive::binary_iarchive ia(ifs);
    std::size_t num_states;
    ia >> num_states;
    for (std::size_t i = 0; i < num_states; ++i) {
      state_t s;
      ia >> s;
      g->add_state(s);
    }
    std::size_t num_edges;
    ia >> num_edges;
    for (std::size_t i = 0; i < num_edges; ++i) {
      edge_t e;
      ia >> e;
      if (!g->has_state(e.first) || !g->has_state(e.second)) {
        BINCFA_ERROR("malformed CFA in ", path, ": edge ", e.first, " -> ",
                     e.second, " between unknown states");
      }
      g->add_successor(g->get_node(e.first), g->get_node(e.second));
    }
    state_id_t counter;
    ia >> counter;
    if (g->size() > 0 && counter < g->ids().back()) {
      BINCFA_ERROR("malformed CFA in ", path, ": counter ", counter,
                   " is below state ", g->ids().back());
    }
    g->id_allocator().reset(counter);
  } catch (bincfa_exception &) {
    throw;
  } catch (boost::archive::archive_exception &e) {
    BINCFA_ERROR("cannot unmarshal a CFA from ", path, ": ", e.what());
  } catch (std::exception &e) {
    // corrupted sizes make the archive allocate (length_error, bad_alloc)
    BINCFA_ERROR("cannot unmarshal a CFA from ", path, ": ", e.what());
  }
  BINCFA_LOG("cfa-io", outs() << "unmarshaled " << g->size() << " states and "
                              << g->num_edges() << " edges from " << path
                              << "\n";);
  return g;
}

// Text dump for humans. Not meant to be read back.
template <class Domain>
void print(const std::string &path, const cfa<Domain> &g, unsigned loglevel) {
  std::ofstream ofs(path.c_str());
  if (!ofs) {
    BINCFA_ERROR("cannot open ", path, " for writing");
  }
  bincfa_os o(ofs);
  g.write(o, loglevel);
  o.flush();
  ofs.close();
  if (!ofs) {
    BINCFA_ERROR("error while writing ", path);
  }
}

} // end namespace cfa
} // end namespace bincfa
