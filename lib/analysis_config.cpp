#include <bincfa/config/analysis_config.hpp>
#include <bincfa/support/debug.hpp>

#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

namespace bincfa {
namespace config {

namespace {
class content_printer : public boost::static_visitor<void> {
  bincfa_os &m_o;

public:
  content_printer(bincfa_os &o) : m_o(o) {}
  void operator()(const content &c) const {
    m_o << "0x" << c.value.get_str(16);
  }
  void operator()(const cmask &c) const {
    m_o << "0x" << c.value.get_str(16) << "?0x" << c.mask.get_str(16);
  }
  void operator()(const bytes_pattern &c) const { m_o << "|" << c.bytes << "|"; }
  void operator()(const taint &t) const { m_o << "!0x" << t.value.get_str(16); }
  void operator()(const tmask &t) const {
    m_o << "!0x" << t.value.get_str(16) << "?0x" << t.mask.get_str(16);
  }
};

// Only decimal digits, up to the largest unsigned
unsigned to_uint(const std::string &val) {
  if (val.empty() || !std::isdigit(static_cast<unsigned char>(val[0]))) {
    BINCFA_ERROR("parameter value \"", val,
                 "\" cannot be converted to an unsigned integer");
  }
  std::size_t pos = 0;
  unsigned long res = 0;
  try {
    res = std::stoul(val, &pos);
  } catch (std::invalid_argument const &e) {
    BINCFA_ERROR("parameter value \"", val,
                 "\" cannot be converted to an unsigned integer");
  } catch (std::out_of_range const &e) {
    BINCFA_ERROR("parameter value ", val,
                 " is out of range for an unsigned integer");
  }
  if (pos != val.size()) {
    BINCFA_ERROR("parameter value \"", val,
                 "\" cannot be converted to an unsigned integer");
  }
  if (res > std::numeric_limits<unsigned>::max()) {
    BINCFA_ERROR("parameter value ", val,
                 " is out of range for an unsigned integer");
  }
  return static_cast<unsigned>(res);
}

void write_init(bincfa_os &o, const init_t &init) {
  o << init.first;
  if (init.second) {
    o << *init.second;
  }
}

void write_table(bincfa_os &o, const char *name, const memory_table_t &tbl) {
  for (auto const &kv : tbl) {
    o << "\t" << name << "[0x" << kv.first.first.get_str(16) << ", "
      << kv.first.second << "]=";
    write_init(o, kv.second);
    o << "\n";
  }
}
} // end anonymous namespace

bincfa_os &operator<<(bincfa_os &o, const content_t &c) {
  boost::apply_visitor(content_printer(o), c);
  return o;
}

bincfa_os &operator<<(bincfa_os &o, const taint_t &t) {
  boost::apply_visitor(content_printer(o), t);
  return o;
}

analysis_config::analysis_config()
    : m_address_sz(32), m_operand_sz(32), m_loglevel(0) {}

void analysis_config::set_param(const std::string &param,
                                const std::string &val) {
  if (param == "analyzer.address_sz") {
    m_address_sz = to_uint(val);
  } else if (param == "analyzer.operand_sz") {
    m_operand_sz = to_uint(val);
  } else if (param == "analyzer.loglevel") {
    m_loglevel = to_uint(val);
  } else {
    BINCFA_WARN("Ignored unsupported parameter ", param);
  }
}

void analysis_config::set_register_init(const std::string &name,
                                        init_t init) {
  if (!m_registers.of_name(name)) {
    BINCFA_ERROR("initial content given for unknown register ", name);
  }
  m_register_content[name] = std::move(init);
}

void analysis_config::add_memory_init(region_t region, z_number addr,
                                      unsigned nb, init_t init) {
  memory_key_t key(std::move(addr), nb);
  switch (region) {
  case GLOBAL:
    m_memory_content[key] = std::move(init);
    break;
  case STACK:
    m_stack_content[key] = std::move(init);
    break;
  case HEAP:
    m_heap_content[key] = std::move(init);
    break;
  default:
    BINCFA_ERROR("unexpected region ", (int)region);
  }
}

const memory_table_t &analysis_config::memory_table(region_t region) const {
  switch (region) {
  case GLOBAL:
    return m_memory_content;
  case STACK:
    return m_stack_content;
  case HEAP:
    return m_heap_content;
  default:
    BINCFA_ERROR("unexpected region ", (int)region);
  }
}

void analysis_config::write(bincfa_os &o) const {
  o << "Analyzer parameters:\n";
  o << "\taddress_sz=" << m_address_sz << "\n";
  o << "\toperand_sz=" << m_operand_sz << "\n";
  o << "\tloglevel=" << m_loglevel << "\n";
  o << "Initial state:\n";
  for (auto const &kv : m_register_content) {
    o << "\treg[" << kv.first << "]=";
    write_init(o, kv.second);
    o << "\n";
  }
  write_table(o, "mem", m_memory_content);
  write_table(o, "stack", m_stack_content);
  write_table(o, "heap", m_heap_content);
}

} // end namespace config
} // end namespace bincfa
