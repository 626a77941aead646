#include <base/Text.hh>
#include <reldate/normaliser.hh>

using namespace reldate;

auto reldate::Normalise(std::string_view input) -> std::string {
    // Transliterators aren’t safe to share between threads.
    thread_local text::Transliterator transliterator{"NFKD; [:M:] Remove; NFC; Lower;"};
    auto folded = str(transliterator(input)).fold_ws();
    return std::string{str(folded).trim().text()};
}

auto reldate::Tokenise(std::string_view normalised) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    for (auto t : str(normalised).split(" "))
        if (not t.empty()) tokens.push_back(t.text());
    return tokens;
}
