#include <scriptor/plugins/hook_events.h>

namespace scriptor::plugins {

namespace {
template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

std::string describeEvent(const HookEvent& event) {
    return std::visit(overloaded{
                          [](const OpenEvent& e) { return "open(" + e.path + ")"; },
                          [](const SaveEvent& e) { return "save(" + e.path + ")"; },
                          [](const GenericEvent& e) {
                              return "event(" + e.name + ", " + e.payload.dump() + ")";
                          },
                      },
                      event);
}

} // namespace scriptor::plugins
