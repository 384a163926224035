#ifndef ENGINE_DOT_HPP
#define ENGINE_DOT_HPP

#include "CatchAllProbe.hpp"
#include "ConcurrencyGate.hpp"
#include "CounterStore.hpp"
#include "FallbackVerifier.hpp"
#include "JobQueue.hpp"
#include "MX.hpp"
#include "Pipeline.hpp"
#include "Preflight.hpp"
#include "Probe.hpp"
#include "SMTP.hpp"
#include "SQLite.hpp"
#include "Settings.hpp"
#include "Store.hpp"
#include "TestSend.hpp"
#include "VerificationTask.hpp"

// The parts every tool shares, wired together over one database.

struct Engine {
  Engine(Engine const&) = delete;
  Engine& operator=(Engine const&) = delete;

  explicit Engine(Settings const& settings);

  static SMTP::Options smtp_options(Settings const& settings);

  Settings const settings;

  SQLite::DB         db;
  Store              store;
  JobQueue           queue;
  SQLiteCounterStore counters;
  MX::LdnsLookup     lookup;
  ConcurrencyGate    gate;
  Preflight          preflight;
  Probe::SmtpProber  prober;
  CatchAllProbe      catch_all;
  NoFallback         fallback;
  TestSendEscalator  escalator;
  VerificationTask   task;
  Pipeline           pipeline;
};

#endif // ENGINE_DOT_HPP
