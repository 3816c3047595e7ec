#include "SmoothSizeUtil/Smooth.h"
#include "SmoothSizeUtil/Exceptions.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

using namespace SmoothSize;
using Smooth::number_t;

const Smooth::factors_t& Smooth::default_factors()
{
    static const factors_t factors{2, 3, 5, 7};
    return factors;
}

const Smooth::exponents_t& Smooth::default_exponents()
{
    static const exponents_t maxexp{{2, 40}, {3, 25}, {5, 17}, {7, 13}};
    return maxexp;
}

void Smooth::validate(const factors_t& factors)
{
    if (factors.empty()) {
        raise<ValueError>("no allowed factors given");
    }
    for (auto p : factors) {
        if (p < 2) {
            raise<ValueError>("allowed factor %d is less than 2", p);
        }
    }
}

number_t Smooth::smallest(const factors_t& factors)
{
    validate(factors);
    return *std::min_element(factors.begin(), factors.end());
}

Smooth::factorization_t Smooth::factorize(number_t n)
{
    if (n < 1) {
        raise<ValueError>("factorization requires a positive integer, got %d", n);
    }

    factorization_t ret;
    for (number_t p : {2, 3, 5}) {
        while (n % p == 0) {
            ++ret[p];
            n /= p;
        }
    }

    // Candidates coprime to 30 starting from 7.
    static const number_t steps[] = {4, 2, 4, 2, 4, 6, 2, 6};
    number_t p = 7;
    size_t step = 0;
    while (p <= n / p) {
        while (n % p == 0) {
            ++ret[p];
            n /= p;
        }
        p += steps[step];
        step = (step + 1) % 8;
    }
    if (n > 1) {
        ++ret[n];
    }
    return ret;
}

// Trial divide by the allowed factors only.  Factors are valid, n > 0.
static bool divides_out(number_t n, const Smooth::factors_t& factors)
{
    if (n == 1) {
        return false;
    }
    for (auto p : factors) {
        while (n % p == 0) {
            n /= p;
        }
        if (n == 1) {
            return true;
        }
    }
    return n == 1;
}

bool Smooth::is_smooth(number_t n, const factors_t& factors)
{
    validate(factors);
    if (n < 1) {
        raise<ValueError>("smoothness requires a positive integer, got %d", n);
    }
    return divides_out(n, factors);
}

Smooth::Found Smooth::nearest(number_t n, bool ascending, const factors_t& factors)
{
    const number_t lo = smallest(factors);
    if (n < 1) {
        raise<ValueError>("search requires a positive integer, got %d", n);
    }

    const number_t start = n;
    while (n >= 1 && !divides_out(n, factors)) {
        if (ascending) {
            if (n == std::numeric_limits<number_t>::max()) {
                raise<ValueError>("ascending search from %d overflows", start);
            }
            ++n;
        }
        else {
            --n;
        }
    }

    Found found;
    if (n < lo) {
        found.value = lo;
        found.warning = String::format(
            "dimension %d is smaller than the smallest allowed factor and the search is descending, using %d",
            start, lo);
        return found;
    }
    found.value = n;
    return found;
}

Smooth::Found Smooth::closest_optimal(number_t n, bool ascending, const factors_t& factors)
{
    return nearest(n, ascending, factors);
}

std::vector<Smooth::Found> Smooth::closest_optimal(const std::vector<number_t>& dims, bool ascending,
                                                   const factors_t& factors)
{
    validate(factors);
    std::vector<Found> ret;
    ret.reserve(dims.size());
    for (auto n : dims) {
        ret.push_back(nearest(n, ascending, factors));
    }
    return ret;
}

std::vector<number_t> Smooth::values(const std::vector<Found>& found)
{
    std::vector<number_t> ret;
    ret.reserve(found.size());
    for (const auto& f : found) {
        ret.push_back(f.value);
    }
    return ret;
}

number_t Smooth::ceiling(const exponents_t& maxexp)
{
    validate(factors_of(maxexp));

    const number_t big = std::numeric_limits<number_t>::max();
    number_t ret = big;
    for (const auto& [p, e] : maxexp) {
        if (e < 0) {
            raise<ValueError>("negative maximum exponent %d for factor %d", e, p);
        }
        number_t pe = 1;
        for (int ind = 0; ind < e; ++ind) {
            if (pe > big / p) {
                pe = big;
                break;
            }
            pe *= p;
        }
        ret = std::min(ret, pe);
    }
    return ret;
}

Smooth::exponents_t Smooth::exponents_for(const factors_t& factors, number_t ceiling)
{
    validate(factors);
    if (ceiling < 1) {
        raise<ValueError>("ceiling must be positive, got %d", ceiling);
    }
    exponents_t ret;
    for (auto p : factors) {
        int e = 0;
        number_t pe = 1;
        while (pe < ceiling) {
            ++e;
            if (pe > (ceiling - 1) / p) {
                break;
            }
            pe *= p;
        }
        ret[p] = e;
    }
    return ret;
}

Smooth::factors_t Smooth::factors_of(const exponents_t& maxexp)
{
    factors_t ret;
    for (const auto& pe : maxexp) {
        ret.push_back(pe.first);
    }
    return ret;
}

Smooth::factors_t Smooth::to_factors(const Configuration& cfg)
{
    if (!cfg.isArray()) {
        raise<ValueError>("allowed factors must be an array of integers");
    }
    factors_t ret;
    for (const auto& one : cfg) {
        if (!one.isInt64()) {
            raise<ValueError>("allowed factor is not a 64 bit integer: %s", one.toStyledString());
        }
        ret.push_back(one.asInt64());
    }
    validate(ret);
    return ret;
}

Smooth::exponents_t Smooth::to_exponents(const Configuration& cfg)
{
    if (!cfg.isObject()) {
        raise<ValueError>("maximum exponents must be an object mapping factor to power");
    }
    exponents_t ret;
    for (const auto& key : cfg.getMemberNames()) {
        number_t p = 0;
        size_t used = 0;
        try {
            p = std::stoll(key, &used);
        }
        catch (const std::logic_error&) {
            raise<ValueError>("factor is not an integer: \"%s\"", key);
        }
        if (used != key.size()) {
            raise<ValueError>("factor is not an integer: \"%s\"", key);
        }
        const auto& val = cfg[key];
        if (!val.isInt()) {
            raise<ValueError>("maximum exponent for factor %d is not an int: %s", p, val.toStyledString());
        }
        ret[p] = val.asInt();
    }
    // validates
    ceiling(ret);
    return ret;
}

Configuration Smooth::to_config(const factors_t& factors)
{
    Configuration ret(Json::arrayValue);
    for (auto p : factors) {
        ret.append(Json::Int64(p));
    }
    return ret;
}

Configuration Smooth::to_config(const exponents_t& maxexp)
{
    Configuration ret(Json::objectValue);
    for (const auto& [p, e] : maxexp) {
        ret[std::to_string(p)] = e;
    }
    return ret;
}
