#include "whois_record.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace {

// Longest formats first so a date-only format never shadows a timestamp
const std::vector<std::string> kDateFormats = {
    "%Y-%m-%dT%H:%M:%S",
    "%Y-%m-%d %H:%M:%S",
    "%Y.%m.%d %H:%M:%S",
    "%d-%b-%Y %H:%M:%S",
    "%d.%m.%Y %H:%M:%S",
    "%Y-%m-%d",
    "%Y.%m.%d",
    "%Y/%m/%d",
    "%d-%b-%Y",
    "%d %b %Y",
    "%d.%m.%Y",
    "%d/%m/%Y",
    "%Y%m%d"
};

bool isPlausible(const std::tm& tm) {
    return tm.tm_year >= 0 && tm.tm_year < 1100 &&
           tm.tm_mon >= 0 && tm.tm_mon < 12 &&
           tm.tm_mday >= 1 && tm.tm_mday <= 31;
}

std::optional<WhoisTime> parseWithFormat(const std::string& text, const std::string& format) {
    std::tm tm = {};
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    iss >> std::get_time(&tm, format.c_str());
    if (iss.fail() || !isPlausible(tm)) {
        return std::nullopt;
    }

    // "%Y%m%d" must consume exactly eight digits
    if (format == "%Y%m%d") {
        auto isDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
        if (text.size() < 8 || !std::all_of(text.begin(), text.begin() + 8, isDigit) ||
            (text.size() > 8 && std::isdigit(static_cast<unsigned char>(text[8])))) {
            return std::nullopt;
        }
    }

    // Registry dates carry no zone normalization, read them as local wall-clock
    tm.tm_isdst = -1;
    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return WhoisClock::from_time_t(t);
}

} // namespace

std::string WhoisDate::format() const {
    if (!value) {
        return "";
    }
    std::time_t t = WhoisClock::to_time_t(*value);
    std::tm tm = *std::localtime(&t);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

WhoisDate WhoisDate::fromTime(WhoisTime time) {
    WhoisDate date;
    date.value = time;
    date.raw = date.format();
    return date;
}

WhoisDate WhoisDate::parse(const std::string& text) {
    WhoisDate date;
    date.raw = text;

    size_t start = text.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return date;
    }
    std::string trimmed = text.substr(start);

    for (const auto& format : kDateFormats) {
        auto parsed = parseWithFormat(trimmed, format);
        if (parsed) {
            date.value = parsed;
            break;
        }
    }
    return date;
}

bool WhoisRecord::hasDomainName() const {
    if (!domainName || domainName->empty()) {
        return false;
    }
    const std::string* first = domainName->first();
    return first != nullptr && !first->empty();
}
