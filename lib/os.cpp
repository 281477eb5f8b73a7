#include <tmopt/support/os.hpp>

#include <iostream>

namespace tmopt {

tmopt_os &outs() { return *tmopt_os::cout(); }
tmopt_os &errs() { return *tmopt_os::cerr(); }

tmopt_os *tmopt_os::m_cout = nullptr;
tmopt_os *tmopt_os::m_cerr = nullptr;

tmopt_os::tmopt_os(std::ostream &os) : m_os(&os) {}

tmopt_os *tmopt_os::cout() {
  if (!m_cout)
    m_cout = new tmopt_os(std::cout);
  return m_cout;
}

tmopt_os *tmopt_os::cerr() {
  if (!m_cerr)
    m_cerr = new tmopt_os(std::cerr);
  return m_cerr;
}

tmopt_os &tmopt_os::operator<<(char C) {
  *m_os << C;
  return *this;
}

tmopt_os &tmopt_os::operator<<(unsigned char C) {
  *m_os << C;
  return *this;
}

tmopt_os &tmopt_os::operator<<(signed char C) {
  *m_os << C;
  return *this;
}

tmopt_os &tmopt_os::operator<<(const char *C) {
  *m_os << C;
  return *this;
}

tmopt_os &tmopt_os::operator<<(const std::string &Str) {
  *m_os << Str;
  return *this;
}

tmopt_os &tmopt_os::operator<<(unsigned long N) {
  *m_os << N;
  return *this;
}

tmopt_os &tmopt_os::operator<<(long N) {
  *m_os << N;
  return *this;
}

tmopt_os &tmopt_os::operator<<(unsigned long long N) {
  *m_os << N;
  return *this;
}

tmopt_os &tmopt_os::operator<<(long long N) {
  *m_os << N;
  return *this;
}

tmopt_os &tmopt_os::operator<<(const void *P) {
  *m_os << P;
  return *this;
}

tmopt_os &tmopt_os::operator<<(unsigned int N) {
  *m_os << N;
  return *this;
}

tmopt_os &tmopt_os::operator<<(int N) {
  *m_os << N;
  return *this;
}

tmopt_os &tmopt_os::operator<<(double N) {
  *m_os << N;
  return *this;
}

tmopt_os &tmopt_os::operator<<(bool B) {
  *m_os << (B ? "true" : "false");
  return *this;
}

} // end namespace tmopt
