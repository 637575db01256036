#pragma once

/*
 * Control Flow Automaton: directed graph whose vertices are analysis
 * states and whose edges are the control flow transitions discovered
 * while the binary is analyzed.
 *
 * The graph owns its states. They are stored by id and the adjacency
 * of each state is a list of ids, so the content of a state can be
 * updated in place without affecting the graph structure.
 *
 * The CFA is parametric on the abstract domain stored in its states.
 */

#include <bincfa/cfa/cfa_init.hpp>
#include <bincfa/cfa/state.hpp>
#include <bincfa/config/analysis_config.hpp>
#include <bincfa/support/debug.hpp>
#include <bincfa/support/os.hpp>
#include <bincfa/support/stats.hpp>
#include <bincfa/types/address.hpp>

#include <boost/noncopyable.hpp>
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bincfa {
namespace cfa {

enum class query_error { NO_PREDECESSOR, MULTIPLE_PREDECESSORS, NOT_FOUND };

inline bincfa_os &operator<<(bincfa_os &o, query_error e) {
  switch (e) {
  case query_error::NO_PREDECESSOR:
    o << "no predecessor";
    break;
  case query_error::MULTIPLE_PREDECESSORS:
    o << "multiple predecessors";
    break;
  case query_error::NOT_FOUND:
    o << "not found";
    break;
  }
  return o;
}

// Outcome of a query that may legitimately have no answer. The
// caller must check has_value() or error() before calling value().
template <class T> class query_result {
  T *m_val;
  query_error m_err;

  query_result(T *v, query_error e) : m_val(v), m_err(e) {}

public:
  static query_result<T> ok(T &v) {
    return query_result<T>(&v, query_error::NOT_FOUND);
  }
  static query_result<T> fail(query_error e) {
    return query_result<T>(nullptr, e);
  }

  bool has_value() const { return m_val != nullptr; }
  explicit operator bool() const { return has_value(); }

  T &value() const {
    if (!m_val) {
      BINCFA_ERROR("query failed: ", m_err);
    }
    return *m_val;
  }

  // Only meaningful if has_value() is false
  query_error error() const { return m_err; }
};

template <class Domain> class cfa : public boost::noncopyable {
public:
  using abstract_domain_t = Domain;
  using state_t = state<Domain>;
  using state_ptr = state_t *;
  using edge_t = std::pair<state_id_t, state_id_t>;

private:
  using state_map_t = std::unordered_map<state_id_t, std::unique_ptr<state_t>>;

  state_map_t m_states;
  state_id_allocator m_alloc;

  // Ids are never shared by two vertices
  state_t &insert(std::unique_ptr<state_t> s) {
    state_id_t id = s->id();
    auto res = m_states.insert(std::make_pair(id, std::move(s)));
    if (!res.second) {
      BINCFA_ERROR("state ", id, " is already a vertex of the CFA");
    }
    return *(res.first->second);
  }

  state_t &lookup(state_id_t id, const char *op) {
    auto it = m_states.find(id);
    if (it == m_states.end()) {
      BINCFA_ERROR(op, ": state ", id, " is not a vertex of the CFA");
    }
    return *(it->second);
  }

  std::vector<state_ptr> to_states(const std::vector<state_id_t> &ids) {
    std::vector<state_ptr> res;
    res.reserve(ids.size());
    for (state_id_t id : ids) {
      res.push_back(&lookup(id, "adjacency"));
    }
    return res;
  }

public:
  // Empty CFA
  cfa() {}

  // Reset the id allocator and return the root state (id 0) whose
  // value is built from the configuration. It is inserted in the CFA,
  // which must be empty.
  state_t &init_state(const address &ip, const config::analysis_config &conf) {
    if (!m_states.empty()) {
      BINCFA_ERROR("init_state: the CFA already has ", m_states.size(),
                   " states");
    }
    Domain v = cfa_initializer::init_abstract_value<Domain>(conf);
    m_alloc.reset(root_state_id);
    decoding_ctx ctx(conf.address_sz(), conf.operand_sz());
    std::unique_ptr<state_t> root(
        new state_t(root_state_id, ip, std::move(v), ctx));
    state_t &res = insert(std::move(root));
    BINCFA_LOG("cfa", outs() << "root state " << res << "\n";);
    return res;
  }

  // Insert a copy of s unless a state with the same id is already a
  // vertex. Return the vertex. Ids issued afterwards are greater than
  // the id of s.
  state_t &add_state(const state_t &s) {
    auto it = m_states.find(s.id());
    if (it != m_states.end()) {
      return *(it->second);
    }
    BINCFA_LOG("cfa", outs() << "add " << s << "\n";);
    m_alloc.observe(s.id());
    return insert(std::unique_ptr<state_t>(new state_t(s)));
  }

  // Remove s and all its incident edges
  void remove_state(const state_t &s) {
    auto it = m_states.find(s.id());
    if (it == m_states.end()) {
      return;
    }
    BINCFA_COUNT_STATS("CFA.remove_state", 1);
    BINCFA_LOG("cfa", outs() << "remove " << s << "\n";);
    state_t &v = *(it->second);
    for (state_id_t p : v.m_prev) {
      if (p != v.id()) {
        state_t &u = lookup(p, "remove_state");
        u.remove_adjacent(u.m_next, v.id());
      }
    }
    for (state_id_t n : v.m_next) {
      if (n != v.id()) {
        state_t &w = lookup(n, "remove_state");
        w.remove_adjacent(w.m_prev, v.id());
      }
    }
    m_states.erase(it);
  }

  // Add the edge src -> dst. Both states must be vertices.
  void add_successor(const state_t &src, const state_t &dst) {
    BINCFA_COUNT_STATS("CFA.add_successor", 1);
    state_t &s = lookup(src.id(), "add_successor");
    state_t &d = lookup(dst.id(), "add_successor");
    BINCFA_LOG("cfa", outs() << "add edge " << s << " -> " << d << "\n";);
    s.insert_adjacent(s.m_next, d.id());
    d.insert_adjacent(d.m_prev, s.id());
  }

  // Remove the edge src -> dst if it exists
  void remove_successor(const state_t &src, const state_t &dst) {
    auto sit = m_states.find(src.id());
    auto dit = m_states.find(dst.id());
    if (sit == m_states.end() || dit == m_states.end()) {
      return;
    }
    BINCFA_LOG("cfa", outs() << "remove edge " << src << " -> " << dst
                             << "\n";);
    sit->second->remove_adjacent(sit->second->m_next, dst.id());
    dit->second->remove_adjacent(dit->second->m_prev, src.id());
  }

  // Insert and return a copy of s with a fresh id and without edges
  state_t &copy_state(const state_t &s) {
    BINCFA_COUNT_STATS("CFA.copy_state", 1);
    std::unique_ptr<state_t> c(new state_t(m_alloc.fresh(), s));
    state_t &res = insert(std::move(c));
    BINCFA_LOG("cfa", outs() << "copy " << s << " into " << res << "\n";);
    return res;
  }

  std::vector<state_ptr> succs(const state_t &s) {
    return to_states(lookup(s.id(), "succs").m_next);
  }

  std::vector<state_ptr> preds(const state_t &s) {
    return to_states(lookup(s.id(), "preds").m_prev);
  }

  // The predecessor of s if it is unique
  query_result<state_t> pred(const state_t &s) {
    const state_t &v = lookup(s.id(), "pred");
    if (v.m_prev.empty()) {
      BINCFA_LOG("cfa", outs() << "no predecessor for " << s << "\n";);
      return query_result<state_t>::fail(query_error::NO_PREDECESSOR);
    }
    if (v.m_prev.size() > 1) {
      BINCFA_LOG("cfa", outs() << v.m_prev.size() << " predecessors for " << s
                               << "\n";);
      return query_result<state_t>::fail(query_error::MULTIPLE_PREDECESSORS);
    }
    return query_result<state_t>::ok(lookup(v.m_prev.front(), "pred"));
  }

  // States without successors, by increasing id
  std::vector<state_ptr> sinks() {
    std::vector<state_ptr> res;
    for (auto &kv : m_states) {
      if (kv.second->m_next.empty()) {
        res.push_back(kv.second.get());
      }
    }
    std::sort(res.begin(), res.end(),
              [](state_ptr a, state_ptr b) { return a->id() < b->id(); });
    return res;
  }

  // The most recently created state at ip
  query_result<state_t> last_addr(const address &ip) {
    state_ptr last = nullptr;
    for (auto &kv : m_states) {
      state_ptr s = kv.second.get();
      if (s->ip() == ip && (!last || last->id() < s->id())) {
        last = s;
      }
    }
    if (!last) {
      BINCFA_LOG("cfa", outs() << "no state at " << ip << "\n";);
      return query_result<state_t>::fail(query_error::NOT_FOUND);
    }
    return query_result<state_t>::ok(*last);
  }

  // Order of visit is unspecified
  void iter_state(std::function<void(state_t &)> f) {
    for (auto &kv : m_states) {
      f(*(kv.second));
    }
  }

  std::size_t size() const { return m_states.size(); }

  std::size_t num_edges() const {
    std::size_t n = 0;
    for (auto const &kv : m_states) {
      n += kv.second->m_next.size();
    }
    return n;
  }

  bool has_state(state_id_t id) const { return m_states.count(id) > 0; }

  bool has_edge(state_id_t src, state_id_t dst) const {
    auto it = m_states.find(src);
    if (it == m_states.end()) {
      return false;
    }
    const std::vector<state_id_t> &next = it->second->m_next;
    return std::find(next.begin(), next.end(), dst) != next.end();
  }

  state_t &get_node(state_id_t id) { return lookup(id, "get_node"); }

  const state_t &get_node(state_id_t id) const {
    auto it = m_states.find(id);
    if (it == m_states.end()) {
      BINCFA_ERROR("get_node: state ", id, " is not a vertex of the CFA");
    }
    return *(it->second);
  }

  // Sorted ids of all vertices
  std::vector<state_id_t> ids() const {
    std::vector<state_id_t> res;
    res.reserve(m_states.size());
    for (auto const &kv : m_states) {
      res.push_back(kv.first);
    }
    std::sort(res.begin(), res.end());
    return res;
  }

  // All edges sorted by (src, dst)
  std::vector<edge_t> edges() const {
    std::vector<edge_t> res;
    for (auto const &kv : m_states) {
      for (state_id_t n : kv.second->m_next) {
        res.push_back(edge_t(kv.first, n));
      }
    }
    std::sort(res.begin(), res.end());
    return res;
  }

  state_id_allocator &id_allocator() { return m_alloc; }
  const state_id_allocator &id_allocator() const { return m_alloc; }

  // Text dump of the CFA. Statements are printed if loglevel > 2.
  void write(bincfa_os &o, unsigned loglevel) const {
    for (state_id_t id : ids()) {
      const state_t &s = get_node(id);
      o << "[node = " << id << "]\n";
      o << "address = " << s.ip().to_string() << "\n";
      o << "bytes =";
      for (uint8_t b : s.bytes()) {
        o << " " << to_hex_byte(b);
      }
      o << "\n";
      o << "final =" << s.is_final() << "\n";
      o << "tainted=" << s.is_tainted() << "\n";
      for (auto const &line : s.v().to_string()) {
        o << line << "\n";
      }
      if (loglevel > 2) {
        o << "statements =";
        for (auto const &st : s.stmts()) {
          o << " " << st;
        }
        o << "\n";
      }
      o << "\n";
    }
    o << "[edges]\n";
    for (auto const &e : edges()) {
      o << "e" << e.first << "_" << e.second << " = " << e.first << " -> "
        << e.second << "\n";
    }
  }

  void write(bincfa_os &o) const { write(o, 0); }

  friend bincfa_os &operator<<(bincfa_os &o, const cfa<Domain> &g) {
    g.write(o);
    return o;
  }

private:
  static std::string to_hex_byte(uint8_t b) {
    const char *digits = "0123456789abcdef";
    std::string res(2, '0');
    res[0] = digits[b >> 4];
    res[1] = digits[b & 0xf];
    return res;
  }
};

} // end namespace cfa
} // end namespace bincfa
