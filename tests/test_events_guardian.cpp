#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/events/event_bus.hpp"
#include "warden/guardian/hint_queue.hpp"
#include "warden/guardian/watchdog.hpp"

#include <thread>

namespace {

warden::events::Event tool_started(const std::string &session, const std::string &tool,
                                   const std::string &args, std::uint32_t attempt = 1) {
  return warden::events::Event{.session_id = session,
                               .payload = warden::events::ToolStarted{.turn = 1,
                                                                      .call_id = "c",
                                                                      .tool = tool,
                                                                      .arguments_json = args,
                                                                      .attempt = attempt}};
}

warden::events::Event usage(const std::string &session, std::uint64_t in, std::uint64_t out) {
  return warden::events::Event{
      .session_id = session,
      .payload = warden::events::UsageUpdated{
          .turn = 1, .input_tokens = in, .output_tokens = out, .total_tokens = in + out}};
}

} // namespace

void register_events_guardian_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace events = warden::events;
  namespace guardian = warden::guardian;
  namespace wt = warden::testing;

  tests.push_back({"event_bus_assigns_increasing_sequence_numbers", [] {
                     events::EventBus bus;
                     auto all = bus.subscribe();
                     const auto first = bus.publish("s1", events::TurnStarted{.turn = 1});
                     const auto second = bus.publish("s1", events::TurnStarted{.turn = 2});
                     require(second == first + 1, "sequence increments by one");
                     require(bus.last_seq() == second, "last_seq tracks newest");

                     const auto received = wt::drain(*all);
                     require(received.size() == 2, "both delivered");
                     require(!received[0].timestamp.empty(), "timestamp stamped");
                     require(received[0].kind() == events::EventKind::TurnStarted, "kind");
                     require(events::event_kind_to_string(received[0].kind()) == "turn_started",
                             "kind name");
                   }});

  tests.push_back({"event_filter_selects_session_and_kind", [] {
                     events::EventBus bus;
                     auto only_s1 = bus.subscribe({.session_id = "s1"});
                     auto text_only = bus.subscribe({.kinds = {events::EventKind::TextDelta}});

                     bus.publish("s1", events::TextDelta{.turn = 1, .text = "a"});
                     bus.publish("s2", events::TextDelta{.turn = 1, .text = "b"});
                     bus.publish("", events::WatchdogHint{.kind = "stall", .message = "m"});
                     bus.publish("s1", events::TurnStarted{.turn = 2});

                     const auto s1_events = wt::drain(*only_s1);
                     require(s1_events.size() == 3, "s1 plus the unscoped event");
                     const auto texts = wt::payloads_of<events::TextDelta>(wt::drain(*text_only));
                     require(texts.size() == 2, "text from both sessions");
                     require(texts[0].text == "a" && texts[1].text == "b", "publication order");
                   }});

  tests.push_back({"slow_subscriber_drops_oldest_events", [] {
                     events::EventBus bus;
                     auto slow = bus.subscribe({}, 2);
                     for (std::size_t i = 1; i <= 5; ++i) {
                       bus.publish("s", events::TurnStarted{.turn = i});
                     }
                     require(slow->dropped() == 3, "three dropped");
                     const auto turns = wt::payloads_of<events::TurnStarted>(wt::drain(*slow));
                     require(turns.size() == 2, "capacity kept");
                     require(turns[0].turn == 4 && turns[1].turn == 5, "newest kept");
                   }});

  tests.push_back({"closed_subscription_is_pruned_from_bus", [] {
                     events::EventBus bus;
                     auto keep = bus.subscribe();
                     {
                       auto dropped = bus.subscribe();
                       require(bus.subscriber_count() == 2, "two subscribers");
                     }
                     keep->close();
                     bus.publish("s", events::TurnStarted{.turn = 1});
                     require(bus.subscriber_count() == 0, "released and closed are pruned");
                     require(!keep->try_next().has_value(), "closed queue receives nothing");
                   }});

  tests.push_back({"subscription_next_wakes_on_publish", [] {
                     auto bus = std::make_shared<events::EventBus>();
                     auto subscription = bus->subscribe();
                     std::thread publisher([bus] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                       bus->publish("s", events::TextDelta{.turn = 1, .text = "late"});
                     });
                     const auto envelope = subscription->next(std::chrono::seconds(2));
                     publisher.join();
                     require(envelope.has_value(), "event received");
                     require(events::describe(envelope->event) == "late", "describe text delta");
                     require(!subscription->next(std::chrono::milliseconds(10)).has_value(),
                             "empty queue times out");
                   }});

  tests.push_back({"hint_queue_pops_in_order", [] {
                     guardian::HintQueue queue;
                     queue.push({.kind = guardian::HintKind::Stall, .message = "first"});
                     queue.push({.kind = guardian::HintKind::DoomLoop, .message = "second"});
                     require(queue.size() == 2, "two queued");
                     const auto hints = queue.pop_all();
                     require(hints.size() == 2 && hints[0].message == "first", "fifo");
                     require(queue.empty(), "drained");
                     require(guardian::hint_kind_to_string(guardian::HintKind::BudgetExceeded) ==
                                 "budget_exceeded",
                             "kind name");
                   }});

  tests.push_back({"watchdog_detects_repeated_identical_calls", [] {
                     auto hints = std::make_shared<guardian::HintQueue>();
                     guardian::Watchdog watchdog({.doom_loop_threshold = 3}, nullptr, "s", hints);

                     watchdog.observe(tool_started("s", "shell", R"({"command":"ls"})"));
                     watchdog.observe(tool_started("s", "shell", R"({"command":"ls"})"));
                     require(hints->empty(), "below threshold");
                     watchdog.observe(tool_started("s", "shell", R"({"command":"ls"})", 2));
                     require(hints->empty(), "retries are not counted");
                     watchdog.observe(tool_started("s", "shell", R"({"command":"ls"})"));

                     const auto raised = hints->pop_all();
                     require(raised.size() == 1, "one doom-loop hint");
                     require(raised[0].kind == guardian::HintKind::DoomLoop, "kind");
                     require(raised[0].message.find("shell(") != std::string::npos,
                             "message names the call");
                     require(watchdog.snapshot().window.empty(), "window reset after hint");
                   }});

  tests.push_back({"watchdog_ignores_varied_calls", [] {
                     auto hints = std::make_shared<guardian::HintQueue>();
                     guardian::Watchdog watchdog({.doom_loop_threshold = 3}, nullptr, "s", hints);
                     for (int i = 0; i < 6; ++i) {
                       const auto args = R"({"n":)" + std::to_string(i % 2) + "}";
                       watchdog.observe(tool_started("s", "file_read", args));
                     }
                     require(hints->empty(), "alternating calls are progress");
                     require(watchdog.snapshot().window.size() == 6, "window bounded at 2x");
                   }});

  tests.push_back({"watchdog_warns_then_reports_budget_exceeded", [] {
                     auto hints = std::make_shared<guardian::HintQueue>();
                     guardian::Watchdog watchdog({.budget_tokens = 100, .budget_warn_pct = 80},
                                                 nullptr, "s", hints);
                     watchdog.observe(usage("s", 50, 10));
                     require(hints->empty(), "60 tokens is below the warning");
                     watchdog.observe(usage("s", 15, 10));
                     auto raised = hints->pop_all();
                     require(raised.size() == 1 &&
                                 raised[0].kind == guardian::HintKind::BudgetWarning,
                             "warning at 85 tokens");
                     watchdog.observe(usage("s", 10, 10));
                     raised = hints->pop_all();
                     require(raised.size() == 1 &&
                                 raised[0].kind == guardian::HintKind::BudgetExceeded,
                             "exceeded at 105 tokens");
                     watchdog.observe(usage("s", 10, 10));
                     require(hints->empty(), "each budget hint fires once");
                     require(watchdog.snapshot().cumulative_tokens == 125, "tokens accumulated");
                   }});

  tests.push_back({"watchdog_reports_stall_after_silence", [] {
                     auto hints = std::make_shared<guardian::HintQueue>();
                     guardian::Watchdog watchdog({.stall_timeout_secs = 30}, nullptr, "s", hints);
                     const auto start = std::chrono::steady_clock::now();
                     watchdog.observe(usage("s", 1, 1), start);
                     watchdog.check_stall(start + std::chrono::seconds(10));
                     require(hints->empty(), "not stalled yet");
                     watchdog.check_stall(start + std::chrono::seconds(31));
                     const auto raised = hints->pop_all();
                     require(raised.size() == 1 && raised[0].kind == guardian::HintKind::Stall,
                             "stall hint");
                     watchdog.check_stall(start + std::chrono::seconds(40));
                     require(hints->empty(), "stall clock restarts after a hint");

                     guardian::Watchdog disabled({.enabled = false}, nullptr, "s", hints);
                     disabled.check_stall(start + std::chrono::hours(1));
                     require(hints->empty(), "disabled watchdog is silent");
                   }});

  tests.push_back({"watchdog_thread_follows_session_events", [] {
                     auto bus = std::make_shared<events::EventBus>();
                     auto hints = std::make_shared<guardian::HintQueue>();
                     auto observer_side = bus->subscribe({.kinds = {events::EventKind::WatchdogHint}});
                     guardian::Watchdog watchdog({.doom_loop_threshold = 2}, bus, "s", hints);
                     watchdog.start();
                     require(watchdog.is_running(), "running");

                     bus->publish(tool_started("other", "shell", "{}"));
                     bus->publish(tool_started("s", "shell", "{}"));
                     const auto seq = bus->publish(tool_started("s", "shell", "{}"));
                     require(watchdog.await_caught_up(seq, std::chrono::seconds(2)),
                             "watchdog caught up");
                     watchdog.stop();
                     require(!watchdog.is_running(), "stopped");

                     const auto raised = hints->pop_all();
                     require(raised.size() == 1, "only this session's calls count");
                     const auto published =
                         wt::payloads_of<events::WatchdogHint>(wt::drain(*observer_side));
                     require(published.size() == 1 && published[0].kind == "doom_loop",
                             "hint published on the bus");
                   }});
}
