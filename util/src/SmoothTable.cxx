#include "SmoothSizeUtil/SmoothTable.h"
#include "SmoothSizeUtil/Exceptions.h"
#include "SmoothSizeUtil/Logging.h"
#include "SmoothSizeUtil/Persist.h"
#include "SmoothSizeUtil/String.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <ostream>

using namespace SmoothSize;
using number_t = SmoothTable::number_t;

SmoothTable::SmoothTable(vector_t values)
  : m_values(std::move(values))
{
    for (size_t ind = 0; ind < m_values.size(); ++ind) {
        if (m_values[ind] < 2) {
            raise<ValueError>("table entry %d has value %d less than 2", ind, m_values[ind]);
        }
        if (ind && m_values[ind - 1] >= m_values[ind]) {
            raise<ValueError>("table is not strictly increasing at entry %d", ind);
        }
    }
}

SmoothTable SmoothTable::build(const Smooth::exponents_t& maxexp, number_t ceiling)
{
    const number_t complete = Smooth::ceiling(maxexp);
    if (ceiling > complete) {
        auto log = Log::logger("util");
        log->warn("SmoothTable: ceiling {} exceeds {}, the table will not hold every smooth number below it",
                  ceiling, complete);
    }

    vector_t values;
    if (ceiling <= 2) {
        return SmoothTable(values);
    }

    std::vector<std::pair<number_t, int>> pes(maxexp.begin(), maxexp.end());

    // Nested loop over each prime's power.  A product always stays below
    // the ceiling so no overflow is possible.
    std::function<void(size_t, number_t)> descend = [&](size_t ind, number_t product) {
        if (ind == pes.size()) {
            if (product > 1) {
                values.push_back(product);
            }
            return;
        }
        const number_t p = pes[ind].first;
        const int emax = pes[ind].second;
        for (int e = 0; e <= emax; ++e) {
            descend(ind + 1, product);
            if (e == emax || product > (ceiling - 1) / p) {
                break;
            }
            product *= p;
        }
    };
    descend(0, 1);

    std::sort(values.begin(), values.end());
    // Only non-prime factors can lead to repeats.
    values.erase(std::unique(values.begin(), values.end()), values.end());
    SPDLOG_DEBUG("SmoothTable: {} entries below {}", values.size(), ceiling);
    return SmoothTable(values);
}

SmoothTable SmoothTable::build(const Smooth::exponents_t& maxexp)
{
    return build(maxexp, Smooth::ceiling(maxexp));
}

number_t SmoothTable::lookup_larger(number_t x) const
{
    auto it = std::lower_bound(m_values.begin(), m_values.end(), x);
    if (it == m_values.end()) {
        raise<IndexError>("no table entry is at least %d, table ends at %d",
                          x, m_values.empty() ? 0 : m_values.back());
    }
    return *it;
}

number_t SmoothTable::lookup_smaller(number_t x) const
{
    auto it = std::upper_bound(m_values.begin(), m_values.end(), x);
    if (it == m_values.begin()) {
        raise<IndexError>("no table entry is at most %d, table starts at %d",
                          x, m_values.empty() ? 0 : m_values.front());
    }
    return *(it - 1);
}

bool SmoothTable::contains(number_t x) const
{
    return std::binary_search(m_values.begin(), m_values.end(), x);
}

number_t SmoothTable::front() const
{
    if (m_values.empty()) {
        raise<IndexError>("empty table has no front");
    }
    return m_values.front();
}

number_t SmoothTable::back() const
{
    if (m_values.empty()) {
        raise<IndexError>("empty table has no back");
    }
    return m_values.back();
}

SmoothTable SmoothTable::prefix(size_t n) const
{
    n = std::min(n, m_values.size());
    return SmoothTable(vector_t(m_values.begin(), m_values.begin() + n));
}

void SmoothTable::emit(std::ostream& out, size_t n_elements, const std::string& name) const
{
    if (n_elements > m_values.size()) {
        raise<IndexError>("table holds %d entries, %d requested", m_values.size(), n_elements);
    }
    const size_t per_line = 10;

    out << "// " << n_elements << " smooth numbers in ascending order\n";
    out << "static const long long " << name << "[" << n_elements << "] = {";
    for (size_t ind = 0; ind < n_elements; ++ind) {
        if (ind % per_line == 0) {
            out << "\n    ";
        }
        out << m_values[ind];
        if (ind + 1 < n_elements) {
            out << ",";
            if ((ind + 1) % per_line) {
                out << " ";
            }
        }
    }
    out << "\n};\n";
}

void SmoothTable::emit(const std::string& filename, size_t n_elements, const std::string& name) const
{
    std::ofstream fstr(filename);
    if (!fstr) {
        raise<IOError>("failed to open for writing: %s", filename);
    }
    emit(fstr, n_elements, name);
    if (!fstr) {
        raise<IOError>("failed to write table to %s", filename);
    }
}

static std::string strip_comments(const std::string& text)
{
    std::string ret;
    size_t pos = 0;
    while (pos < text.size()) {
        if (text.compare(pos, 2, "//") == 0) {
            pos = text.find('\n', pos);
            if (pos == std::string::npos) {
                break;
            }
            continue;
        }
        if (text.compare(pos, 2, "/*") == 0) {
            pos = text.find("*/", pos + 2);
            if (pos == std::string::npos) {
                raise<ValueError>("unterminated comment in table text");
            }
            pos += 2;
            continue;
        }
        ret.push_back(text[pos]);
        ++pos;
    }
    return ret;
}

static number_t parse_entry(const std::string& tok)
{
    if (tok.empty() || !std::all_of(tok.begin(), tok.end(), [](unsigned char c) { return std::isdigit(c); })) {
        raise<ValueError>("table entry is not a positive integer: \"%s\"", tok);
    }
    try {
        return std::stoll(tok);
    }
    catch (const std::out_of_range&) {
        raise<ValueError>("table entry is too large: \"%s\"", tok);
    }
}

SmoothTable SmoothTable::parse(const std::string& text)
{
    vector_t values;

    auto first = text.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && text[first] == '[') {
        auto arr = Persist::loads(text);
        for (const auto& one : arr) {
            if (!one.isIntegral()) {
                raise<ValueError>("table entry is not an integer: %s", one.toStyledString());
            }
            values.push_back(one.asInt64());
        }
        return SmoothTable(values);
    }

    const std::string code = strip_comments(text);
    const auto eq = code.find('=');
    const auto beg = code.find('{', eq == std::string::npos ? 0 : eq);
    const auto end = code.find('}', beg == std::string::npos ? 0 : beg);
    if (beg == std::string::npos || end == std::string::npos) {
        raise<ValueError>("no braced list of table entries found");
    }
    for (const auto& tok : String::split(code.substr(beg + 1, end - beg - 1), ", \t\r\n")) {
        if (tok.empty()) {
            continue;
        }
        values.push_back(parse_entry(tok));
    }
    return SmoothTable(values);
}

SmoothTable SmoothTable::load(const std::string& filename)
{
    return parse(Persist::slurp(filename));
}
