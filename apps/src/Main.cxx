#include "SmoothSizeApps/Main.h"
#include "SmoothSizeAux/SizerTools.h"
#include "SmoothSizeAux/TableSizer.h"
#include "SmoothSizeUtil/Exceptions.h"
#include "SmoothSizeUtil/Persist.h"
#include "SmoothSizeUtil/String.h"

#include <boost/program_options.hpp>

namespace po = boost::program_options;
using namespace SmoothSize;

Main::Main(std::ostream& out)
  : m_out(out)
{
}

Main::~Main() {}

int Main::cmdline(int argc, char* argv[])
{
    po::options_description desc(
        "Find the nearest smooth size to each dimension\n\n"
        "Usage:\n\tsmooth-size [-h/--help|options] [dim ...]\n\nOptions");
    desc.add_options()("help,h", "produce help message")

        ("descending,d", po::bool_switch(&m_descending),
         "search for the nearest smaller size instead of larger")

        ("factor,f", po::value<std::vector<Smooth::number_t> >(),
         "an allowed prime factor, may be repeated (default 2, 3, 5 and 7)")

        ("table,t", po::bool_switch(&m_table),
         "use a precomputed table instead of factorization")

        ("ceiling,C", po::value<Smooth::number_t>(&m_ceiling),
         "exclusive upper bound of the table (default 7^13)")

        ("config,c", po::value<std::string>(&m_config),
         "JSON file giving the sizer as {\"type\":..., \"data\":{...}}")

        ("emit,e", po::value<std::string>(&m_emit),
         "write the table as a C++ source fragment to this file")

        ("nelements,n", po::value<size_t>(&m_nelements),
         "number of table entries to emit (default 8000)")

        ("factorize,F", po::bool_switch(&m_factorize),
         "also print the prime factorization of each input and result")

        ("logsink,l", po::value<std::vector<std::string> >(),
         "set log sink as <filename> or 'stdout' or 'stderr', "
         "a log level for the sink may be given by appending ':<level>'")

        ("loglevel,L", po::value<std::vector<std::string> >(),
         "set lowest log level for a log in form 'name:level' "
         "or just give 'level' value for all "
         "(level one of: critical,error,warn,info,debug,trace)")

        ("dim", po::value<std::vector<Smooth::number_t> >(),
         "a dimension size");

    po::positional_options_description pos;
    pos.add("dim", -1);

    po::variables_map opts;
    po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), opts);
    po::notify(opts);

    if (opts.count("help")) {
        m_out << desc << "\n";
        return 1;
    }

    if (opts.count("factor")) {
        for (auto f : opts["factor"].as<std::vector<Smooth::number_t> >()) {
            add_factor(f);
        }
    }
    if (opts.count("dim")) {
        for (auto d : opts["dim"].as<std::vector<Smooth::number_t> >()) {
            add_dim(d);
        }
    }
    if (opts.count("logsink")) {
        for (auto ls : opts["logsink"].as<std::vector<std::string> >()) {
            auto ll = String::split(ls, ":");
            if (ll.size() == 1) {
                add_logsink(ll[0]);
            }
            if (ll.size() == 2) {
                add_logsink(ll[0], ll[1]);
            }
        }
    }
    if (opts.count("loglevel")) {
        for (auto ll : opts["loglevel"].as<std::vector<std::string> >()) {
            auto lal = String::split(ll, ":");
            if (lal.size() == 2) {
                set_loglevel(lal[0], lal[1]);
            }
            else {
                set_loglevel("", lal[0]);
            }
        }
    }
    return 0;
}

void Main::add_logsink(const std::string& log, const std::string& level)
{
    if (level.empty()) {
        m_logsinks.push_back(log);
    }
    else {
        m_logsinks.push_back(log + ":" + level);
    }
}

void Main::set_loglevel(const std::string& log, const std::string& level)
{
    if (log.empty()) {
        m_loglevels.push_back(level);
    }
    else {
        m_loglevels.push_back(log + ":" + level);
    }
}

void Main::set_emit(const std::string& filename, size_t nelements)
{
    m_emit = filename;
    m_nelements = nelements;
}

void Main::initialize()
{
    if (m_logsinks.empty()) {
        Log::add_stderr(true);
    }
    for (const auto& ls : m_logsinks) {
        auto [sink, level] = String::parse_pair(ls);
        if (sink == "stdout") {
            Log::add_stdout(true, level);
        }
        else if (sink == "stderr") {
            Log::add_stderr(true, level);
        }
        else {
            Log::add_file(sink, level);
        }
    }
    Log::set_level("info");
    for (const auto& ll : m_loglevels) {
        auto lal = String::split(ll, ":");
        if (lal.size() == 2) {
            Log::set_level(lal[1], lal[0]);
        }
        else {
            Log::set_level(lal[0]);
        }
    }
    l = Log::logger("main");

    Configuration cfg;
    if (m_config.empty()) {
        cfg["type"] = (m_table || !m_emit.empty()) ? "TableSizer" : "FactorSizer";
    }
    else {
        cfg = Persist::load(m_config);
        l->debug("loaded sizer configuration from {}", m_config);
        if (!cfg.isObject()) {
            raise<ValueError>("sizer configuration in %s is not an object", m_config);
        }
        if (!(cfg["data"].isNull() || cfg["data"].isObject())) {
            raise<ValueError>("sizer configuration data in %s is not an object", m_config);
        }
    }

    const std::string type = get<std::string>(cfg, "type", "FactorSizer");
    if (type == "TableSizer" && m_ceiling) {
        put(cfg, "data.ceiling", Json::Int64(m_ceiling));
    }
    if (!m_factors.empty()) {
        if (type == "TableSizer") {
            Smooth::number_t ceiling = get<Smooth::number_t>(cfg, "data.ceiling", 0);
            if (!ceiling) {
                ceiling = Smooth::ceiling(Smooth::default_exponents());
            }
            put(cfg, "data.exponents", Smooth::to_config(Smooth::exponents_for(m_factors, ceiling)));
            put(cfg, "data.ceiling", Json::Int64(ceiling));
        }
        else {
            put(cfg, "data.factors", Smooth::to_config(m_factors));
        }
    }

    m_sizer = Aux::SizerTools::make_sizer(cfg);
    l->debug("using {} sizer", type);
}

static std::string factorization_string(Smooth::number_t n)
{
    std::vector<std::string> terms;
    for (const auto& [p, e] : Smooth::factorize(n)) {
        if (e == 1) {
            terms.push_back(std::to_string(p));
        }
        else {
            terms.push_back(fmt::format("{}^{}", p, e));
        }
    }
    if (terms.empty()) {
        return "1";
    }
    return String::join(terms, " * ");
}

int Main::operator()()
{
    if (!m_sizer) {
        raise<ValueError>("Main must be initialized before it is run");
    }

    if (!m_emit.empty()) {
        auto ts = std::dynamic_pointer_cast<Aux::TableSizer>(m_sizer);
        if (!ts) {
            raise<ValueError>("emitting a table requires a TableSizer");
        }
        ts->table().emit(m_emit, m_nelements);
        l->info("wrote {} table entries to {}", m_nelements, m_emit);
    }

    auto found = Aux::SizerTools::nearest(m_sizer, m_dims, !m_descending, l);
    for (size_t ind = 0; ind < m_dims.size(); ++ind) {
        if (m_factorize) {
            m_out << m_dims[ind] << " (" << factorization_string(m_dims[ind]) << ") -> "
                  << found[ind].value << " (" << factorization_string(found[ind].value) << ")\n";
        }
        else {
            m_out << m_dims[ind] << " -> " << found[ind].value << "\n";
        }
    }
    return 0;
}
