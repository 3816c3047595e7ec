#include "SmoothSizeAux/FactorSizer.h"
#include "SmoothSizeUtil/String.h"

using namespace SmoothSize;

Aux::FactorSizer::FactorSizer()
  : Aux::Logger("FactorSizer", "aux")
  , m_factors(Smooth::default_factors())
{
}

Aux::FactorSizer::~FactorSizer() {}

Configuration Aux::FactorSizer::default_configuration() const
{
    Configuration cfg;
    cfg["factors"] = Smooth::to_config(m_factors);
    return cfg;
}

void Aux::FactorSizer::configure(const Configuration& cfg)
{
    if (cfg.isMember("factors")) {
        m_factors = Smooth::to_factors(cfg["factors"]);
    }
    log->debug("factors=[{}]", String::join(m_factors));
}

Smooth::Found Aux::FactorSizer::nearest(number_t n, bool ascending) const
{
    auto found = Smooth::nearest(n, ascending, m_factors);
    // Callers report the clamp, see SizerTools::nearest().
    if (found.clamped()) {
        log->debug("{}", *found.warning);
    }
    return found;
}
