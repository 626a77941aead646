#include <clopts.hh>
#include <print>
#include <reldate/json.hh>
#include <reldate/parser.hh>
#include <reldate/resolver.hh>

using namespace reldate;

namespace cmd {
using namespace command_line_options;
using options = clopts< // clang-format off
    positional<"phrase", "Phrase to parse, e.g. 'amanhã' or 'in 3 days'">,
    option<"--locale", "Locale of the phrase (default: pt-BR)", values<"pt-BR", "en">>,
    option<"--date", "Reference date as YYYY-MM-DD (default: today)">,
    flag<"--all", "Extract every expression in the phrase instead of parsing all of it">,
    flag<"--json", "Print the result as JSON">,
    help<>
>; // clang-format on
}

namespace {
template <typename T>
auto Lift(ParseResult<T> res) -> Result<T> {
    if (res.has_value()) return std::move(res.value());
    return Error("{}", res.error());
}

auto Main(int argc, char** argv) -> Result<int> {
    auto opts = cmd::options::parse(argc, argv);
    auto phrase = *opts.get<"phrase">();
    auto locale = Try(Lift(ParseLocale(opts.get<"--locale">() ? *opts.get<"--locale">() : "pt-BR")));
    auto lexicon = Try(Lift(Lookup(locale)));
    auto reference = opts.get<"--date">() ? Try(ParseIsoDate(*opts.get<"--date">())) : CurrentDate();

    std::vector<RelativeExpression> exprs;
    if (opts.get<"--all">()) exprs = Try(Lift(ExtractAll(phrase, locale)));
    else exprs.push_back(Try(Lift(Parse(phrase, locale))));

    if (opts.get<"--json">()) {
        std::println("{}", ToJson(phrase, *lexicon, reference, exprs).dump(4));
        return 0;
    }

    for (const auto& e : exprs) std::println("{} => {}", e, Resolve(e, reference));
    return 0;
}
} // namespace

int main(int argc, char** argv) {
    auto res = Main(argc, argv);
    if (not res.has_value()) {
        std::println(stderr, "Error: {}", res.error());
        return 1;
    }

    return res.value();
}
