#pragma once

/*
 * Nodes of the Control Flow Automaton.
 *
 * The identity of a state is its id: equality, ordering and hashing
 * only look at it, so the abstract value, the statements and the
 * flags can be updated in place while the state is stored in the CFA.
 *
 * Ids are issued by a state_id_allocator owned by the CFA. The root
 * state always has id 0 and does not consume an id from the
 * allocator: the first copy of the root gets id 1.
 */

#include <bincfa/ir/stmt.hpp>
#include <bincfa/support/os.hpp>
#include <bincfa/types/address.hpp>

#include <boost/optional.hpp>
#include <boost/serialization/access.hpp>
#include <boost/serialization/version.hpp>
#include <boost/serialization/optional.hpp>
#include <boost/serialization/vector.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace bincfa {
namespace cfa {

using state_id_t = std::size_t;

// Id of the root state
constexpr state_id_t root_state_id = 0;

class state_id_allocator {
  state_id_t m_last;

public:
  state_id_allocator() : m_last(root_state_id) {}

  // Return a fresh id
  state_id_t fresh() { return ++m_last; }

  // Last issued id
  state_id_t current() const { return m_last; }

  // Ids issued afterwards are greater than id
  void observe(state_id_t id) {
    if (m_last < id) {
      m_last = id;
    }
  }

  // Only to restart the numbering: by the root initialization or when
  // a persisted CFA is restored.
  void reset(state_id_t v) { m_last = v; }
};

// Context of the decoding
struct decoding_ctx {
  // size in bits of the addresses
  unsigned addr_sz;
  // size in bits of the operands
  unsigned op_sz;

  decoding_ctx() : addr_sz(0), op_sz(0) {}
  decoding_ctx(unsigned addr, unsigned op) : addr_sz(addr), op_sz(op) {}

  template <class Archive> void serialize(Archive &ar, const unsigned int) {
    ar &addr_sz;
    ar &op_sz;
  }
};

template <class Domain> class cfa;

template <class Domain> class state {
  friend class cfa<Domain>;
  friend class boost::serialization::access;

public:
  using abstract_domain_t = Domain;
  using state_t = state<Domain>;
  using stmt_list_t = std::vector<ir::stmt>;
  using byte_list_t = std::vector<uint8_t>;

private:
  using id_set_t = std::vector<state_id_t>;

  state_id_t m_id;
  address m_ip;
  Domain m_v;
  decoding_ctx m_ctx;
  // statements of the instruction at m_ip
  stmt_list_t m_stmts;
  // a widening operator has been applied to m_v
  bool m_final;
  bool m_back_loop;
  bool m_forward_loop;
  // none if the predecessor is unconditional, otherwise the branch
  // of the predecessor that has been taken
  boost::optional<bool> m_branch;
  byte_list_t m_bytes;
  // some left value of m_stmts may be tainted
  bool m_is_tainted;

  // adjacency, only maintained by the CFA
  id_set_t m_prev, m_next;

  void insert_adjacent(id_set_t &c, state_id_t e) {
    if (std::find(c.begin(), c.end(), e) == c.end()) {
      c.push_back(e);
    }
  }

  void remove_adjacent(id_set_t &c, state_id_t e) {
    c.erase(std::remove(c.begin(), c.end(), e), c.end());
  }

  // The adjacency is stored by the CFA as a separate edge list
  template <class Archive>
  void serialize(Archive &ar, const unsigned int /*version*/) {
    ar &m_id;
    ar &m_ip;
    ar &m_v;
    ar &m_ctx;
    ar &m_stmts;
    ar &m_final;
    ar &m_back_loop;
    ar &m_forward_loop;
    ar &m_branch;
    ar &m_bytes;
    ar &m_is_tainted;
  }

  // copy of the content of o with a different id and without edges
  state(state_id_t id, const state_t &o)
      : m_id(id), m_ip(o.m_ip), m_v(o.m_v), m_ctx(o.m_ctx),
        m_stmts(o.m_stmts), m_final(o.m_final), m_back_loop(o.m_back_loop),
        m_forward_loop(o.m_forward_loop), m_branch(o.m_branch),
        m_bytes(o.m_bytes), m_is_tainted(o.m_is_tainted) {}

public:
  // needed by deserialization
  state()
      : m_id(root_state_id), m_final(false), m_back_loop(false),
        m_forward_loop(false), m_is_tainted(false) {}

  state(state_id_t id, address ip, Domain v, decoding_ctx ctx)
      : m_id(id), m_ip(std::move(ip)), m_v(std::move(v)), m_ctx(ctx),
        m_final(false), m_back_loop(false), m_forward_loop(false),
        m_is_tainted(false) {}

  // A copy keeps the same identity. Adjacency is not copied.
  state(const state_t &o) : state(o.m_id, o) {}

  state_t &operator=(const state_t &o) {
    if (this != &o) {
      m_id = o.m_id;
      m_ip = o.m_ip;
      m_v = o.m_v;
      m_ctx = o.m_ctx;
      m_stmts = o.m_stmts;
      m_final = o.m_final;
      m_back_loop = o.m_back_loop;
      m_forward_loop = o.m_forward_loop;
      m_branch = o.m_branch;
      m_bytes = o.m_bytes;
      m_is_tainted = o.m_is_tainted;
      m_prev.clear();
      m_next.clear();
    }
    return *this;
  }

  state_id_t id() const { return m_id; }

  const address &ip() const { return m_ip; }
  void set_ip(address ip) { m_ip = std::move(ip); }

  Domain &v() { return m_v; }
  const Domain &v() const { return m_v; }
  void set_v(Domain v) { m_v = std::move(v); }

  const decoding_ctx &ctx() const { return m_ctx; }
  void set_ctx(decoding_ctx ctx) { m_ctx = ctx; }

  stmt_list_t &stmts() { return m_stmts; }
  const stmt_list_t &stmts() const { return m_stmts; }
  void set_stmts(stmt_list_t stmts) { m_stmts = std::move(stmts); }

  bool is_final() const { return m_final; }
  void set_final(bool v) { m_final = v; }

  bool back_loop() const { return m_back_loop; }
  void set_back_loop(bool v) { m_back_loop = v; }

  bool forward_loop() const { return m_forward_loop; }
  void set_forward_loop(bool v) { m_forward_loop = v; }

  const boost::optional<bool> &branch() const { return m_branch; }
  void set_branch(boost::optional<bool> b) { m_branch = b; }

  const byte_list_t &bytes() const { return m_bytes; }
  void set_bytes(byte_list_t bytes) { m_bytes = std::move(bytes); }

  bool is_tainted() const { return m_is_tainted; }
  void set_tainted(bool v) { m_is_tainted = v; }

  std::size_t in_degree() const { return m_prev.size(); }
  std::size_t out_degree() const { return m_next.size(); }

  bool operator==(const state_t &o) const { return m_id == o.m_id; }
  bool operator!=(const state_t &o) const { return m_id != o.m_id; }
  // a state created before o is smaller
  bool operator<(const state_t &o) const { return m_id < o.m_id; }

  std::size_t hash() const { return std::hash<state_id_t>()(m_id); }

  // short form used by logs
  void write(bincfa_os &o) const { o << "s" << m_id << "@" << m_ip; }

  friend bincfa_os &operator<<(bincfa_os &o, const state_t &s) {
    s.write(o);
    return o;
  }
};

template <class Domain> inline std::size_t hash_value(const state<Domain> &s) {
  return s.hash();
}

} // end namespace cfa
} // end namespace bincfa

namespace std {
template <class Domain> struct hash<bincfa::cfa::state<Domain>> {
  size_t operator()(const bincfa::cfa::state<Domain> &s) const {
    return s.hash();
  }
};
} // end namespace std
