#include "Engine.hpp"

#include "Worker.hpp"

Engine::Engine(Settings const& s)
  : settings(s)
  , db(settings.db_path)
  , store(db)
  , queue(db)
  , counters(db)
  , lookup(settings.dns_timeout)
  , gate(counters, settings.lease_ttl)
  , preflight(counters,
              lookup,
              settings.smtp_port,
              settings.preflight_timeout,
              settings.preflight_cache_ttl)
  , prober(lookup, smtp_options(settings), settings.mail_from)
  , catch_all(store, lookup, prober, settings.catch_all_ttl)
  , escalator(store,
              settings.bounce_prefix,
              settings.bounce_domain,
              test_send_enqueuer(queue))
  , task(settings,
         store,
         lookup,
         preflight,
         gate,
         prober,
         catch_all,
         fallback,
         &escalator)
  , pipeline(settings, store, queue)
{
}

SMTP::Options Engine::smtp_options(Settings const& settings)
{
  SMTP::Options opts;
  opts.helo_domain     = settings.helo_domain;
  opts.port            = settings.smtp_port;
  opts.starttls        = settings.starttls;
  opts.connect_timeout = settings.effective_connect_timeout();
  opts.command_timeout = settings.effective_command_timeout();
  return opts;
}
