#include "SockBuffer.hpp"

#include <glog/logging.h>

#include <gflags/gflags.h>

#include <boost/algorithm/string/trim.hpp>

DEFINE_bool(log_data, false, "log all SMTP protocol data");

SockBuffer::SockBuffer(int                       fd_in,
                       int                       fd_out,
                       std::chrono::milliseconds read_timeout,
                       std::chrono::milliseconds write_timeout,
                       std::chrono::milliseconds starttls_timeout)
  : fd_in_(fd_in)
  , fd_out_(fd_out)
  , read_timeout_(read_timeout)
  , write_timeout_(write_timeout)
  , starttls_timeout_(starttls_timeout)
  , tls_(std::make_shared<TLS>())
{
  if (!POSIX::set_nonblocking(fd_in_) || !POSIX::set_nonblocking(fd_out_)) {
    LOG(WARNING) << "unable to make socket non-blocking";
  }
  log_data_ = (FLAGS_log_data || (getenv("VRFY_LOG_DATA") != nullptr));
}

SockBuffer::SockBuffer(SockBuffer const& that)
  : fd_in_(that.fd_in_)
  , fd_out_(that.fd_out_)
  , read_timeout_(that.read_timeout_)
  , write_timeout_(that.write_timeout_)
  , starttls_timeout_(that.starttls_timeout_)
  , log_data_(that.log_data_)
  , tls_(that.tls_)
{
  CHECK(!that.timed_out_);
  CHECK(!that.tls_active_);
}

std::streamsize SockBuffer::read(char* s, std::streamsize n)
{
  auto read = tls_active_ ? tls_->read(s, n, read_timeout_, timed_out_)
                          : POSIX::read(fd_in_, s, n, read_timeout_,
                                        timed_out_);
  if (read == 0) {
    eof_ = true;
    return static_cast<std::streamsize>(-1);
  }
  if (read == static_cast<std::streamsize>(-1))
    return read;

  total_octets_read_ += read;

  if (log_data_) {
    auto str = std::string(s, static_cast<size_t>(read));
    LOG(INFO) << "< «" << boost::algorithm::trim_right_copy(str) << "»";
  }

  return read;
}

std::streamsize SockBuffer::write(const char* s, std::streamsize n)
{
  auto written = tls_active_
                     ? tls_->write(s, n, write_timeout_, timed_out_)
                     : POSIX::write(fd_out_, s, n, write_timeout_, timed_out_);
  if (written != static_cast<std::streamsize>(-1)) {
    total_octets_written_ += written;

    if (log_data_) {
      auto str = std::string(s, static_cast<size_t>(written));
      LOG(INFO) << "> «" << boost::algorithm::trim_right_copy(str) << "»";
    }
  }

  return written;
}

void SockBuffer::log_totals() const
{
  LOG(INFO) << "total_octets_read_==" << total_octets_read_;
  LOG(INFO) << "total_octets_written_==" << total_octets_written_;
}
