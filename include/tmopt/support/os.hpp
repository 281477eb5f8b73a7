#pragma once

#include <iosfwd>
#include <string>

namespace tmopt {

// Thin wrapper over std::ostream so that every printable object of
// the library writes to the same kind of stream.
class tmopt_os {
  std::ostream *m_os;

  static tmopt_os *m_cout;
  static tmopt_os *m_cerr;

public:
  static tmopt_os *cout();
  static tmopt_os *cerr();

  tmopt_os(std::ostream &os);
  virtual ~tmopt_os() = default;

  tmopt_os(const tmopt_os &o) = delete;
  tmopt_os &operator=(const tmopt_os &o) = delete;

  tmopt_os &operator<<(char C);
  tmopt_os &operator<<(unsigned char C);
  tmopt_os &operator<<(signed char C);
  tmopt_os &operator<<(const char *Str);
  tmopt_os &operator<<(const std::string &Str);
  tmopt_os &operator<<(unsigned long N);
  tmopt_os &operator<<(long N);
  tmopt_os &operator<<(unsigned long long N);
  tmopt_os &operator<<(long long N);
  tmopt_os &operator<<(const void *P);
  tmopt_os &operator<<(unsigned int N);
  tmopt_os &operator<<(int N);
  tmopt_os &operator<<(double N);
  tmopt_os &operator<<(bool B);
};

extern tmopt_os &outs();
extern tmopt_os &errs();

} // end namespace tmopt
