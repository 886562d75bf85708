#include <shellsense/fuzzy/fzf_ranker.h>

#include <deque>
#include <map>

namespace shellsense {

namespace {

std::string sanitizeLine(const std::string& text) {
    std::string line = text;
    for (char& c : line) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return line;
}

} // namespace

FzfRanker::FzfRanker(ProcessRunner& runner, Logger& logger, std::string fzfPath, std::chrono::milliseconds timeout)
    : runner(runner)
    , logger(logger)
    , fzfPath(std::move(fzfPath))
    , timeout(timeout)
{
}

bool FzfRanker::isAvailable() {
    if (this->available) {
        return *this->available;
    }

    ProcessRequest request;
    request.argv = {this->fzfPath, "--version"};
    request.timeout = this->timeout;
    ProcessResult result = this->runner.run(request);
    this->available = result.isOk();
    this->logger.debug("FzfRanker: '{}' is {}", this->fzfPath, *this->available ? "available" : "not available");
    return *this->available;
}

std::optional<std::vector<RankedItem>> FzfRanker::rank(std::string_view query, const std::vector<std::string>& texts) {
    if (!this->isAvailable()) {
        return std::nullopt;
    }

    std::vector<RankedItem> ranked;
    if (query.empty()) {
        for (size_t i = 0; i < texts.size(); ++i) {
            ranked.push_back(RankedItem{i, FuzzyMatch{1.0, {}}});
        }
        return ranked;
    }
    if (texts.empty()) {
        return ranked;
    }

    // fzf prints matching lines; identical lines are mapped back in input order
    std::map<std::string, std::deque<size_t>> indicesByLine;
    std::string input;
    for (size_t i = 0; i < texts.size(); ++i) {
        std::string line = sanitizeLine(texts[i]);
        input += line;
        input += '\n';
        indicesByLine[std::move(line)].push_back(i);
    }

    ProcessRequest request;
    request.argv = {this->fzfPath, "--filter", std::string(query), "--no-sort", "--tiebreak=index", "-i"};
    request.input = std::move(input);
    request.timeout = this->timeout;
    ProcessResult result = this->runner.run(request);

    if (result.exited() && result.exitCode == 1) {
        return ranked;
    }
    if (!result.isOk()) {
        this->logger.debug("FzfRanker: helper failed (exit code {}), disabling", result.exitCode);
        this->available = false;
        return std::nullopt;
    }

    std::vector<size_t> order;
    for (const auto& line : result.lines()) {
        auto it = indicesByLine.find(line);
        if (it == indicesByLine.end() || it->second.empty()) {
            continue;
        }
        order.push_back(it->second.front());
        it->second.pop_front();
    }

    const double count = static_cast<double>(order.size());
    for (size_t position = 0; position < order.size(); ++position) {
        ranked.push_back(RankedItem{order[position], FuzzyMatch{1.0 - static_cast<double>(position) / count, {}}});
    }
    return ranked;
}

} // namespace shellsense
