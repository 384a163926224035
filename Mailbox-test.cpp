#include "Mailbox.hpp"

#include <iostream>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Mailbox mb;
  CHECK(mb.empty());

  Mailbox const dg0{"Brett.Anderson@Example.COM"};
  CHECK_EQ(dg0.local_part(), "Brett.Anderson");
  CHECK_EQ(dg0.domain(), "example.com");
  CHECK_EQ(dg0.as_string(), "Brett.Anderson@example.com");

  Mailbox const dg1{"Brett.Anderson", "EXAMPLE.com"};
  CHECK(dg0 == dg1);
  CHECK(Mailbox{"brett.anderson@example.com"} != dg0);

  CHECK(Mailbox::parse("  someone@example.com \n"));

  CHECK(!Mailbox::parse(""));
  CHECK(!Mailbox::parse("no-at-sign.example.com"));
  CHECK(!Mailbox::parse("two@at@example.com"));
  CHECK(!Mailbox::parse("@example.com"));
  CHECK(!Mailbox::parse("someone@"));
  CHECK(!Mailbox::parse("some one@example.com"));

  auto threw = false;
  try {
    Mailbox bad("should throw@example.com");
  }
  catch (std::invalid_argument const& e) {
    threw = true;
  }
  CHECK(threw);

  std::cout << dg0 << '\n';
}
