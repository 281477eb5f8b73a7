#pragma once

/*
 * Statements of a procedure body.
 *
 * The language is the small subset of a three-address intermediate
 * representation that the state propagation analysis needs to look
 * at: which locals a statement defines and uses, and whether an
 * assignment copies one local into another.
 *
 *   x = y             assign_stmt whose right-hand side is a local
 *   x = 5             assign_stmt whose right-hand side is a constant
 *   x = y.f           assign_stmt whose right-hand side reads a field
 *   x = foo(y, z)     assign_stmt whose right-hand side is a call
 *   x = new T         assign_stmt whose right-hand side allocates
 *   foo(y, z)         invoke_stmt
 *   if (x) goto ...   branch_stmt
 *   return x          return_stmt
 *   nop               nop_stmt (labelled, e.g., to anchor a shadow)
 */

#include <tmopt/cfg/local.hpp>
#include <tmopt/support/debug.hpp>
#include <tmopt/support/os.hpp>

#include <boost/optional.hpp>
#include <boost/range/iterator_range.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace tmopt {
namespace cfg {

enum stmt_code {
  UNDEF = 0,
  ASSIGN = 20,
  INVOKE = 30,
  BRANCH = 40,
  RETURN = 50,
  NOP = 60
};

enum value_kind {
  LOCAL_VAL,
  CONSTANT_VAL,
  FIELD_READ_VAL,
  INVOKE_EXPR_VAL,
  NEW_EXPR_VAL
};

// Right-hand side of an assignment
class value {
  value_kind m_kind;
  // the local for LOCAL_VAL or the base object for FIELD_READ_VAL
  boost::optional<local> m_local;
  // constant, field name, callee name or allocated type
  std::string m_text;
  std::vector<local> m_args;

  value(value_kind kind, boost::optional<local> l, std::string text,
        std::vector<local> args)
      : m_kind(kind), m_local(l), m_text(text), m_args(args) {}

public:
  static value mk_local(local l) {
    return value(LOCAL_VAL, l, "", std::vector<local>());
  }
  static value mk_constant(std::string cst) {
    return value(CONSTANT_VAL, boost::none, cst, std::vector<local>());
  }
  static value mk_field_read(local base, std::string field) {
    return value(FIELD_READ_VAL, base, field, std::vector<local>());
  }
  static value mk_invoke(std::string callee, std::vector<local> args) {
    return value(INVOKE_EXPR_VAL, boost::none, callee, args);
  }
  static value mk_new(std::string type) {
    return value(NEW_EXPR_VAL, boost::none, type, std::vector<local>());
  }

  value_kind kind() const { return m_kind; }

  bool is_local() const { return m_kind == LOCAL_VAL; }

  const local &get_local() const {
    if (!is_local()) {
      TMOPT_ERROR("value::get_local called on a value which is not a local");
    }
    return *m_local;
  }

  // locals read when evaluating the value
  std::vector<local> uses() const {
    std::vector<local> res;
    if (m_local) {
      res.push_back(*m_local);
    }
    res.insert(res.end(), m_args.begin(), m_args.end());
    return res;
  }

  void write(tmopt_os &o) const {
    switch (m_kind) {
    case LOCAL_VAL:
      o << *m_local;
      break;
    case CONSTANT_VAL:
      o << m_text;
      break;
    case FIELD_READ_VAL:
      o << *m_local << "." << m_text;
      break;
    case INVOKE_EXPR_VAL: {
      o << m_text << "(";
      for (unsigned i = 0, sz = m_args.size(); i < sz;) {
        o << m_args[i];
        ++i;
        if (i < sz) {
          o << ",";
        }
      }
      o << ")";
      break;
    }
    case NEW_EXPR_VAL:
      o << "new " << m_text;
      break;
    default:
      TMOPT_ERROR("unexpected value kind ", (int)m_kind);
    }
  }

  friend tmopt_os &operator<<(tmopt_os &o, const value &v) {
    v.write(o);
    return o;
  }
};

// Locals used and defined by a statement
class live {
  using live_set_t = std::vector<local>;

public:
  using const_use_iterator = live_set_t::const_iterator;
  using const_def_iterator = live_set_t::const_iterator;

private:
  live_set_t m_uses;
  live_set_t m_defs;

  void add(live_set_t &s, const local &v) {
    auto it = std::find(s.begin(), s.end(), v);
    if (it == s.end())
      s.push_back(v);
  }

public:
  live() {}

  void add_use(const local &v) { add(m_uses, v); }
  void add_def(const local &v) { add(m_defs, v); }

  const_use_iterator uses_begin() const { return m_uses.begin(); }
  const_use_iterator uses_end() const { return m_uses.end(); }
  const_def_iterator defs_begin() const { return m_defs.begin(); }
  const_def_iterator defs_end() const { return m_defs.end(); }

  boost::iterator_range<const_use_iterator> uses() const {
    return boost::make_iterator_range(uses_begin(), uses_end());
  }
  boost::iterator_range<const_def_iterator> defs() const {
    return boost::make_iterator_range(defs_begin(), defs_end());
  }

  std::size_t num_uses() const { return m_uses.size(); }
  std::size_t num_defs() const { return m_defs.size(); }

  friend tmopt_os &operator<<(tmopt_os &o, const live &l) {
    o << "Use={";
    for (auto const &v : l.uses())
      o << v << ",";
    o << "} Def={";
    for (auto const &v : l.defs())
      o << v << ",";
    o << "}";
    return o;
  }
};

class cfg;
struct statement_visitor;

class statement {
  friend class cfg;

protected:
  live m_live;
  stmt_code m_stmt_code;
  // position of the statement in its procedure body
  std::size_t m_index;

  statement(stmt_code code, std::size_t index)
      : m_stmt_code(code), m_index(index) {}

public:
  virtual ~statement() = default;

  statement(const statement &o) = delete;
  statement &operator=(const statement &o) = delete;

  bool is_assign() const { return m_stmt_code == ASSIGN; }
  bool is_invoke() const { return m_stmt_code == INVOKE; }
  bool is_branch() const { return m_stmt_code == BRANCH; }
  bool is_return() const { return m_stmt_code == RETURN; }
  bool is_nop() const { return m_stmt_code == NOP; }

  stmt_code code() const { return m_stmt_code; }

  std::size_t index() const { return m_index; }

  const live &get_live() const { return m_live; }

  virtual void accept(statement_visitor *v) const = 0;

  virtual void write(tmopt_os &o) const = 0;

  // for gdb
  void dump() const { write(tmopt::errs()); }

  friend tmopt_os &operator<<(tmopt_os &o, const statement &s) {
    s.write(o);
    return o;
  }
};

class assign_stmt : public statement {
  local m_lhs;
  value m_rhs;

public:
  assign_stmt(local lhs, value rhs, std::size_t index)
      : statement(ASSIGN, index), m_lhs(lhs), m_rhs(rhs) {
    m_live.add_def(m_lhs);
    for (auto const &v : m_rhs.uses()) {
      m_live.add_use(v);
    }
  }

  const local &lhs() const { return m_lhs; }

  const value &rhs() const { return m_rhs; }

  // x = y where both sides are plain locals
  bool is_local_copy() const { return m_rhs.is_local(); }

  virtual void accept(statement_visitor *v) const override;

  virtual void write(tmopt_os &o) const override {
    o << m_lhs << " = " << m_rhs;
  }
};

class invoke_stmt : public statement {
  std::string m_callee;
  std::vector<local> m_args;

public:
  invoke_stmt(std::string callee, std::vector<local> args, std::size_t index)
      : statement(INVOKE, index), m_callee(callee), m_args(args) {
    for (auto const &v : m_args) {
      m_live.add_use(v);
    }
  }

  const std::string &callee() const { return m_callee; }

  const std::vector<local> &args() const { return m_args; }

  virtual void accept(statement_visitor *v) const override;

  virtual void write(tmopt_os &o) const override {
    o << m_callee << "(";
    for (unsigned i = 0, sz = m_args.size(); i < sz;) {
      o << m_args[i];
      ++i;
      if (i < sz) {
        o << ",";
      }
    }
    o << ")";
  }
};

class branch_stmt : public statement {
  local m_cond;

public:
  branch_stmt(local cond, std::size_t index)
      : statement(BRANCH, index), m_cond(cond) {
    m_live.add_use(m_cond);
  }

  const local &cond() const { return m_cond; }

  virtual void accept(statement_visitor *v) const override;

  virtual void write(tmopt_os &o) const override {
    o << "if (" << m_cond << ") goto";
  }
};

class return_stmt : public statement {
  boost::optional<local> m_ret;

public:
  return_stmt(boost::optional<local> ret, std::size_t index)
      : statement(RETURN, index), m_ret(ret) {
    if (m_ret) {
      m_live.add_use(*m_ret);
    }
  }

  const boost::optional<local> &ret() const { return m_ret; }

  virtual void accept(statement_visitor *v) const override;

  virtual void write(tmopt_os &o) const override {
    o << "return";
    if (m_ret) {
      o << " " << *m_ret;
    }
  }
};

class nop_stmt : public statement {
  std::string m_label;

public:
  nop_stmt(std::string label, std::size_t index)
      : statement(NOP, index), m_label(label) {}

  const std::string &label() const { return m_label; }

  virtual void accept(statement_visitor *v) const override;

  virtual void write(tmopt_os &o) const override {
    o << "nop";
    if (!m_label.empty()) {
      o << " " << m_label;
    }
  }
};

struct statement_visitor {
  virtual void visit(const assign_stmt &) {}
  virtual void visit(const invoke_stmt &) {}
  virtual void visit(const branch_stmt &) {}
  virtual void visit(const return_stmt &) {}
  virtual void visit(const nop_stmt &) {}
  virtual ~statement_visitor() {}
};

inline void assign_stmt::accept(statement_visitor *v) const { v->visit(*this); }
inline void invoke_stmt::accept(statement_visitor *v) const { v->visit(*this); }
inline void branch_stmt::accept(statement_visitor *v) const { v->visit(*this); }
inline void return_stmt::accept(statement_visitor *v) const { v->visit(*this); }
inline void nop_stmt::accept(statement_visitor *v) const { v->visit(*this); }

} // end namespace cfg
} // end namespace tmopt
