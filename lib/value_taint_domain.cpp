#include <bincfa/domains/value_taint_domain.hpp>
#include <bincfa/support/debug.hpp>

namespace bincfa {
namespace domains {

namespace {
const char *region_prefix(region_t region) {
  switch (region) {
  case STACK:
    return "S";
  case HEAP:
    return "H";
  default:
    return "";
  }
}

bool is_nonzero_taint(const config::taint_t &t) {
  if (const config::taint *exact = boost::get<config::taint>(&t)) {
    return !exact->value.is_zero();
  }
  const config::tmask &masked = boost::get<config::tmask>(t);
  return !masked.value.is_zero() || !masked.mask.is_zero();
}
} // end anonymous namespace

void value_taint_domain::add_register(const reg &r) {
  register_cell cell;
  cell.size = r.size();
  cell.region = GLOBAL;
  m_registers[r.name()] = cell;
}

void value_taint_domain::set_register_from_config(const reg &r,
                                                  region_t region,
                                                  const config::init_t &init) {
  auto it = m_registers.find(r.name());
  if (it == m_registers.end()) {
    BINCFA_ERROR("register ", r.name(), " has not been added to the domain");
  }
  if (boost::get<config::bytes_pattern>(&init.first)) {
    BINCFA_ERROR("Illegal memory init \"|xx|\" spec used for register ",
                 r.name());
  }
  register_cell &cell = it->second;
  cell.region = region;
  cell.content = init.first;
  cell.taint = init.second;
}

void value_taint_domain::set_memory_from_config(const address &addr,
                                                region_t region,
                                                const config::init_t &init,
                                                unsigned nb) {
  if (addr.region() != region) {
    BINCFA_WARN("memory init at ", addr, " requested in region ", region);
  }
  memory_cell cell;
  cell.nb = nb;
  cell.content = init.first;
  cell.taint = init.second;
  m_memory[location_t(addr, nb)] = cell;
}

std::vector<std::string> value_taint_domain::to_string() const {
  std::vector<std::string> lines;
  lines.reserve(m_registers.size() + m_memory.size());
  for (auto const &kv : m_registers) {
    const register_cell &cell = kv.second;
    bincfa_string_os o;
    o << "reg [" << kv.first << "] = ";
    if (cell.content) {
      o << region_prefix(cell.region) << *cell.content;
    } else {
      o << "?";
    }
    if (cell.taint) {
      o << *cell.taint;
    }
    lines.push_back(o.str());
  }
  for (auto const &kv : m_memory) {
    const memory_cell &cell = kv.second;
    bincfa_string_os o;
    o << "mem [" << kv.first.first << ", " << cell.nb << "] = " << cell.content;
    if (cell.taint) {
      o << *cell.taint;
    }
    lines.push_back(o.str());
  }
  return lines;
}

const value_taint_domain::register_cell &
value_taint_domain::get_register(const std::string &name) const {
  auto it = m_registers.find(name);
  if (it == m_registers.end()) {
    BINCFA_ERROR("register ", name, " not found in the abstract value");
  }
  return it->second;
}

boost::optional<value_taint_domain::memory_cell>
value_taint_domain::get_memory(const address &addr, unsigned nb) const {
  auto it = m_memory.find(location_t(addr, nb));
  if (it == m_memory.end()) {
    return boost::none;
  }
  return it->second;
}

bool value_taint_domain::is_tainted(const std::string &reg_name) const {
  const register_cell &cell = get_register(reg_name);
  return cell.taint && is_nonzero_taint(*cell.taint);
}

} // end namespace domains
} // end namespace bincfa
