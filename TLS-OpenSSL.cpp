#include "TLS-OpenSSL.hpp"

#include <cerrno>
#include <cstring>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <glog/logging.h>

#include <fmt/format.h>

#include "POSIX.hpp"

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

static int verify_callback(int preverify_ok, X509_STORE_CTX* ctx)
{
  auto const cert = X509_STORE_CTX_get_current_cert(ctx);
  if (cert == nullptr)
    return 1;

  auto const err   = X509_STORE_CTX_get_error(ctx);
  auto const depth = X509_STORE_CTX_get_error_depth(ctx);

  char buf[256];
  X509_NAME_oneline(X509_get_subject_name(cert), buf, sizeof(buf));

  if (!preverify_ok) {
    LOG(INFO) << "verify error:num=" << err << ':'
              << X509_verify_cert_error_string(err) << ": depth=" << depth
              << ':' << buf;
  }

  return 1; // always continue
}

TLS::~TLS()
{
  if (ssl_) {
    SSL_free(ssl_);
  }
  if (ctx_) {
    SSL_CTX_free(ctx_);
  }
}

bool TLS::starttls_client(int          fd_in,
                          int          fd_out,
                          char const*  server_name,
                          milliseconds timeout)
{
  ctx_ = SSL_CTX_new(TLS_client_method());
  if (ctx_ == nullptr) {
    log_ssl_error(SSL_ERROR_SSL);
    return false;
  }

  SSL_CTX_set_options(ctx_, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3);

  if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
    LOG(WARNING) << "SSL_CTX_set_default_verify_paths failed";
  }

  SSL_CTX_set_verify_depth(ctx_, Config::cert_verify_depth + 1);
  SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, verify_callback);

  ssl_ = SSL_new(ctx_);
  if (ssl_ == nullptr) {
    log_ssl_error(SSL_ERROR_SSL);
    return false;
  }

  SSL_set_rfd(ssl_, fd_in);
  SSL_set_wfd(ssl_, fd_out);

  if (server_name && *server_name) {
    SSL_set1_host(ssl_, server_name);
    SSL_set_tlsext_host_name(ssl_, server_name);
  }

  // No partial label wildcards
  SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);

  auto const end_time = steady_clock::now() + timeout;

  ERR_clear_error();

  int rc;
  while ((rc = SSL_connect(ssl_)) <= 0) {

    auto const now = steady_clock::now();
    if (now >= end_time) {
      LOG(WARNING) << "starttls timed out";
      return false;
    }

    auto const time_left = duration_cast<milliseconds>(end_time - now);

    int n_get_err;
    switch (n_get_err = SSL_get_error(ssl_, rc)) {
    case SSL_ERROR_WANT_READ:
      if (!POSIX::input_ready(fd_in, time_left)) {
        LOG(WARNING) << "starttls timed out on input_ready";
        return false;
      }
      ERR_clear_error();
      continue; // try SSL_connect again

    case SSL_ERROR_WANT_WRITE:
      if (!POSIX::output_ready(fd_out, time_left)) {
        LOG(WARNING) << "starttls timed out on output_ready";
        return false;
      }
      ERR_clear_error();
      continue; // try SSL_connect again

    case SSL_ERROR_SYSCALL:
      LOG(WARNING) << "errno == " << errno << ": " << std::strerror(errno);
      [[fallthrough]];

    default: log_ssl_error(n_get_err); return false;
    }
  }

  if (SSL_get_verify_result(ssl_) == X509_V_OK) {
    LOG(INFO) << "server certificate verified";
    verified_ = true;
  }
  else {
    LOG(INFO) << "server certificate failed to verify";
  }

  return true;
}

std::string TLS::info() const
{
  auto const c = ssl_ ? SSL_get_current_cipher(ssl_) : nullptr;
  if (c) {
    int alg_bits;
    int bits = SSL_CIPHER_get_bits(c, &alg_bits);
    return fmt::format("version={} cipher={} bits={}/{}{}",
                       SSL_CIPHER_get_version(c), SSL_CIPHER_get_name(c), bits,
                       alg_bits, (verified_ ? " verified" : ""));
  }

  return "";
}

std::streamsize TLS::io_tls_(char const*                          fn,
                             std::function<int(SSL*, void*, int)> io_fnc,
                             char*                                s,
                             std::streamsize                      n,
                             milliseconds                         timeout,
                             bool&                                t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  ERR_clear_error();

  int n_ret;
  while ((n_ret = io_fnc(ssl_, static_cast<void*>(s), static_cast<int>(n)))
         < 0) {
    auto const now = steady_clock::now();
    if (now > end_time) {
      LOG(WARNING) << fn << " timed out";
      t_o = true;
      return static_cast<std::streamsize>(-1);
    }

    auto const time_left = duration_cast<milliseconds>(end_time - now);

    int n_get_err;
    switch (n_get_err = SSL_get_error(ssl_, n_ret)) {
    case SSL_ERROR_WANT_READ: {
      if (POSIX::input_ready(SSL_get_rfd(ssl_), time_left)) {
        ERR_clear_error();
        continue; // try io_fnc again
      }
      LOG(WARNING) << fn << " timed out";
      t_o = true;
      return static_cast<std::streamsize>(-1);
    }

    case SSL_ERROR_WANT_WRITE: {
      if (POSIX::output_ready(SSL_get_wfd(ssl_), time_left)) {
        ERR_clear_error();
        continue; // try io_fnc again
      }
      LOG(WARNING) << fn << " timed out";
      t_o = true;
      return static_cast<std::streamsize>(-1);
    }

    case SSL_ERROR_SYSCALL:
      LOG(WARNING) << "errno == " << errno << ": " << std::strerror(errno);
      [[fallthrough]];

    default: log_ssl_error(n_get_err); return static_cast<std::streamsize>(-1);
    }
  }

  if (0 == n_ret) {
    // Close notify from the peer, or an unclean shutdown.
    auto const n_get_err = SSL_get_error(ssl_, n_ret);
    if (n_get_err != SSL_ERROR_ZERO_RETURN && n_get_err != SSL_ERROR_NONE) {
      log_ssl_error(n_get_err);
      return static_cast<std::streamsize>(-1);
    }
  }

  return static_cast<std::streamsize>(n_ret);
}

void TLS::log_ssl_error(int n_get_err)
{
  switch (n_get_err) {
  case SSL_ERROR_NONE: LOG(WARNING) << "SSL_ERROR_NONE"; break;
  case SSL_ERROR_ZERO_RETURN: LOG(WARNING) << "SSL_ERROR_ZERO_RETURN"; break;
  case SSL_ERROR_WANT_READ: LOG(WARNING) << "SSL_ERROR_WANT_READ"; break;
  case SSL_ERROR_WANT_WRITE: LOG(WARNING) << "SSL_ERROR_WANT_WRITE"; break;
  case SSL_ERROR_SYSCALL: LOG(WARNING) << "SSL_ERROR_SYSCALL"; break;
  case SSL_ERROR_SSL: LOG(WARNING) << "SSL_ERROR_SSL"; break;
  default: LOG(WARNING) << "n_get_err == " << n_get_err; break;
  }
  unsigned long er;
  while (0 != (er = ERR_get_error()))
    LOG(WARNING) << ERR_error_string(er, nullptr);
}
