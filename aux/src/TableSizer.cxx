#include "SmoothSizeAux/TableSizer.h"
#include "SmoothSizeUtil/Exceptions.h"

using namespace SmoothSize;

Aux::TableSizer::TableSizer()
  : Aux::Logger("TableSizer", "aux")
  , m_exponents(Smooth::default_exponents())
{
}

Aux::TableSizer::~TableSizer() {}

Configuration Aux::TableSizer::default_configuration() const
{
    Configuration cfg;
    // Exponents are left out so that an update() with user exponents
    // replaces rather than merges with the defaults.
    cfg["ceiling"] = Json::Int64(m_ceiling);
    cfg["filename"] = m_filename;
    return cfg;
}

void Aux::TableSizer::configure(const Configuration& cfg)
{
    if (cfg["exponents"].isNull()) {
        m_exponents = Smooth::default_exponents();
    }
    else {
        m_exponents = Smooth::to_exponents(cfg["exponents"]);
    }
    m_ceiling = get<number_t>(cfg, "ceiling", m_ceiling);
    if (m_ceiling < 0) {
        raise<ValueError>("TableSizer: ceiling must not be negative, got %d", m_ceiling);
    }
    m_filename = get(cfg, "filename", m_filename);

    if (m_filename.empty()) {
        if (m_ceiling) {
            m_table = SmoothTable::build(m_exponents, m_ceiling);
        }
        else {
            m_table = SmoothTable::build(m_exponents);
        }
        log->debug("built {} entries below {} from exponents {}",
                   m_table.size(), m_ceiling ? m_ceiling : Smooth::ceiling(m_exponents), m_exponents);
    }
    else {
        m_table = SmoothTable::load(m_filename);
        log->debug("loaded {} entries from {}", m_table.size(), m_filename);
    }
    if (m_table.empty()) {
        log->warn("table is empty, every lookup will fail");
    }
}

Smooth::Found Aux::TableSizer::nearest(number_t n, bool ascending) const
{
    Smooth::Found found;
    if (ascending) {
        found.value = m_table.lookup_larger(n);
    }
    else {
        found.value = m_table.lookup_smaller(n);
    }
    return found;
}
