#include <cstdlib>
#include <expected>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <cligram.hpp>

enum class action {
    set_alarm, clear_alarm, show_alarm, bread, help, exit
};

struct alarm_clock {
    long long hour;
    bool pm;
    bool loud;
    std::string message;
};
std::optional<alarm_clock> current_alarm;

cligram::dispatcher<action> make_dispatcher() {
    cligram::config config;
    config.diagnostics = &std::cerr;
    cligram::dispatcher<action> dispatcher{config};
    dispatcher.types().register_type("hour", [](std::string_view str) -> std::expected<cligram::value, std::string> {
        auto hour = cligram::parse_number<long long>(str);
        if (!hour) return std::unexpected(std::move(hour.error()));
        if (*hour < 1 || *hour > 12) return std::unexpected("hours go from 1 to 12");
        return *hour;
    });
    const std::pair<std::string_view, std::pair<action, std::string_view>> commands[] = {
        {"set [loud] alarm at <time: hour> (am|pm) [with message <message...*>]",
            {action::set_alarm, "Sets the alarm. The message keeps its spacing."}},
        {"(clear~|remove~|delete~) alarm", {action::clear_alarm, "Clears the alarm."}},
        {"show^ alarm", {action::show_alarm, "Shows the alarm."}},
        {"i [don't] like bread", {action::bread, "Shares your opinion about bread."}},
        {"help", {action::help, "Prints this text."}},
        {"exit|quit", {action::exit, "Exits the program."}}
    };
    for (const auto& [grammar, command] : commands) {
        if (auto res = dispatcher.add(grammar, command.first, std::string{command.second}); !res) {
            res.error().print(std::cerr);
            std::exit(EXIT_FAILURE);
        }
    }
    return dispatcher;
}
const auto dispatcher = make_dispatcher();

// res: std::expected<dispatch_result, dispatch_error>
int run(const auto& res) {
    using enum action;
    if (!res) {
        res.error().print();
        return EXIT_FAILURE;
    }
    const cligram::call_match& match = res->match;
    switch (res->result) {
        case set_alarm: {
            current_alarm = alarm_clock{
                match.get<long long>("time"), match.variant(0) == 1, match.optional(0),
                match.contains("message") ? match.get<std::string>("message") : std::string{}
            };
            std::cout << "Alarm set.\n";
            break;
        }
        case clear_alarm: {
            current_alarm.reset();
            std::cout << "Alarm cleared.\n";
            break;
        }
        case show_alarm: {
            if (!current_alarm) {
                std::cout << "No alarm.\n";
                break;
            }
            std::cout << (current_alarm->loud ? "Loud alarm at " : "Alarm at ") << current_alarm->hour
                << (current_alarm->pm ? " pm" : " am");
            if (!current_alarm->message.empty()) std::cout << ": " << current_alarm->message;
            std::cout << '\n';
            break;
        }
        case bread: {
            std::cout << (match.optional(0) ? "More for me then.\n" : "Me too!\n");
            break;
        }
        case help: {
            dispatcher.print_usage();
            break;
        }
        case exit: {
            std::exit(EXIT_SUCCESS);
        }
    }
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    if (argc <= 1) {
        std::string line;
        while (std::cout << ">> " && std::getline(std::cin, line)) {
            auto res = dispatcher.match(line);
            run(res);
        }
        return EXIT_SUCCESS;
    }
    std::string call;
    for (int i = 1; i < argc; ++i) {
        if (i > 1) call += ' ';
        call += argv[i];
    }
    auto res = dispatcher.match(call);
    return run(res);
}
