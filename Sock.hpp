#ifndef SOCK_DOT_HPP
#define SOCK_DOT_HPP

#include <string>

#include "SockBuffer.hpp"

// A connected client socket as an iostream.  Owns the fd.

class Sock {
public:
  Sock(const Sock&) = delete;
  Sock& operator=(const Sock&) = delete;

  Sock(int                       fd,
       std::chrono::milliseconds read_timeout,
       std::chrono::milliseconds write_timeout,
       std::chrono::milliseconds starttls_timeout);
  ~Sock();

  std::string const& them_c_str() const { return them_addr_str_; }

  bool input_ready(std::chrono::milliseconds wait)
  {
    return iostream_->input_ready(wait);
  }
  bool timed_out() { return iostream_->timed_out(); }
  bool eof() { return iostream_->eof(); }

  std::istream& in() { return iostream_; }
  std::ostream& out() { return iostream_; }

  bool starttls_client(char const* server_name)
  {
    return iostream_->starttls_client(server_name);
  }
  bool        tls() { return iostream_->tls(); }
  std::string tls_info() { return iostream_->tls_info(); }

  void log_totals() { iostream_->log_totals(); }

private:
  int fd_;

  boost::iostreams::stream<SockBuffer> iostream_;

  std::string them_addr_str_;
};

#endif // SOCK_DOT_HPP
