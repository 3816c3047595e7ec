#include "SmoothSizeAux/SizerTools.h"
#include "SmoothSizeAux/FactorSizer.h"
#include "SmoothSizeAux/TableSizer.h"
#include "SmoothSizeIface/IConfigurable.h"
#include "SmoothSizeUtil/Exceptions.h"
#include "SmoothSizeUtil/String.h"

#include <memory>

using namespace SmoothSize;

std::vector<Smooth::Found> Aux::SizerTools::nearest(const ISizer::pointer& sizer,
                                                    const std::vector<Smooth::number_t>& dims,
                                                    bool ascending, Log::logptr_t log)
{
    if (!sizer) {
        raise<ValueError>("no sizer given");
    }
    std::vector<Smooth::Found> ret;
    ret.reserve(dims.size());
    for (size_t ind = 0; ind < dims.size(); ++ind) {
        ret.push_back(sizer->nearest(dims[ind], ascending));
        if (log && ret.back().clamped()) {
            log->warn("dimension {} of {}: {}", ind, dims.size(), *ret.back().warning);
        }
    }
    return ret;
}

std::vector<std::string> Aux::SizerTools::known_types()
{
    return {"FactorSizer", "TableSizer"};
}

ISizer::pointer Aux::SizerTools::make_sizer(const Configuration& cfg)
{
    if (!cfg.isObject()) {
        raise<ValueError>("sizer configuration is not an object");
    }
    if (!(cfg["data"].isNull() || cfg["data"].isObject())) {
        raise<ValueError>("sizer configuration data is not an object");
    }
    const std::string type = get<std::string>(cfg, "type", "FactorSizer");

    std::shared_ptr<IConfigurable> icfg;
    ISizer::pointer sizer;
    if (type == "FactorSizer") {
        auto fs = std::make_shared<FactorSizer>();
        fs->set_name(get<std::string>(cfg, "name", ""));
        icfg = fs;
        sizer = fs;
    }
    else if (type == "TableSizer") {
        auto ts = std::make_shared<TableSizer>();
        ts->set_name(get<std::string>(cfg, "name", ""));
        icfg = ts;
        sizer = ts;
    }
    else {
        raise<ValueError>("unknown sizer type \"%s\", known: %s",
                          type, String::join(known_types(), ", "));
    }

    auto full = icfg->default_configuration();
    update(full, cfg["data"]);
    icfg->configure(full);
    return sizer;
}

ISizer::pointer Aux::SizerTools::default_sizer(const std::string& type)
{
    Configuration cfg;
    cfg["type"] = type;
    return make_sizer(cfg);
}
