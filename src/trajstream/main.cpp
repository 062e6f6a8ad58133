#include "pch.hpp"

#include <cxxopts.hpp>

#include "exception.hpp"
#include "configfile.hpp"
#include "library.hpp"
#include "input.hpp"
#include "extract.hpp"
#include "streaming.hpp"
#include "trajectory_stats.hpp"

using namespace std;

template<class T>
void overwrite_dataset(library::Dataset<T>& ds, ConfigFilePtr pConfig, ConfigFile::SectionPtr pSection)
{
    const auto keys = pConfig->keys(pSection);
    for(const auto& key : keys)
        ds.overwrite(key, pConfig->as<T>(pSection, key));
}

StreamingOptions loader_options(ConfigFilePtr pConfig)
{
    StreamingOptions options;
    if(!pConfig)
        return options;

    options.bUseIndexing = pConfig->as<bool>("loader", "use_indexing", options.bUseIndexing);
    options.bExtractPlotMetadata = pConfig->as<bool>("loader", "extract_plot_metadata", options.bExtractPlotMetadata);
    options.nIndexSampleRate = pConfig->as<size_t>("loader", "sample_rate", options.nIndexSampleRate);
    options.nInitialFrames = pConfig->as<size_t>("loader", "initial_frames", options.nInitialFrames);
    return options;
}

void print_frame(ostream& os, const TrajectoryFrame& frame)
{
    const auto& structure = frame.m_structure;
    os << "step " << frame.m_nStep << ", " << structure.m_aSites.size() << " atoms\n";

    if(structure.m_pLattice)
    {
        const Lattice& lattice = *structure.m_pLattice;
        os << "lattice (a, b, c, alpha, beta, gamma): " 
           << lattice.a() << " " << lattice.b() << " " << lattice.c() << " " 
           << lattice.alpha() << " " << lattice.beta() << " " << lattice.gamma() << "\n";
    }

    for(const auto& [key, value] : frame.m_metadata)
        os << "  " << key << " = " << formatMetadataValue(value) << "\n";

    for(const auto& site : structure.m_aSites)
        os << site.m_sLabel << "\t" << site.m_vXyz.transpose() << "\n";
}

void print_plot_metadata(ostream& os, const vector<TrajectoryMetadata>& aMetadata)
{
    set<string> columns;
    for(const auto& m : aMetadata)
    {
        for(const auto& [key, value] : m.m_mProperties)
            columns.insert(key);
    }

    os << "# frame";
    for(const auto& c : columns)
        os << "\t" << c;
    os << "\n";

    for(const auto& m : aMetadata)
    {
        os << m.m_nFrameNumber;
        for(const auto& c : columns)
        {
            auto pValue = m.m_mProperties.find(c);
            os << "\t";
            if(pValue != m.m_mProperties.end())
                os << pValue->second;
            else
                os << "-";
        }
        os << "\n";
    }
}


DataExtractor extractor_by_name(const string& sName)
{
    if(sName == "energy")
        return energyDataExtractor;
    if(sName == "forces")
        return forceStressDataExtractor;
    if(sName == "structure")
        return structuralDataExtractor;
    if(sName == "all")
        return combinedDataExtractor;
    THROW(invalid_argument, "Unknown extractor \"", sName, "\", expected energy, forces, structure or all");
}

// one row per loaded frame, columns are the union of all extracted keys
void print_extracted(ostream& os, const TrajectoryData& data, const DataExtractor& extractor)
{
    vector<ExtractedData> aRows;
    set<string> columns;
    for(const auto& pFrame : data.m_aFrames)
    {
        aRows.push_back(extractor(*pFrame, data));
        for(const auto& [key, value] : aRows.back())
            columns.insert(key);
    }

    os << "#";
    for(const auto& c : columns)
        os << "\t" << c;
    os << "\n";

    for(const auto& row : aRows)
    {
        for(const auto& c : columns)
        {
            auto pValue = row.find(c);
            os << "\t";
            if(pValue != row.end())
                os << pValue->second;
            else
                os << "-";
        }
        os << "\n";
    }
}

int main(int argc, char** argv)
{ 
    try 
    {
        cxxopts::Options options("trajstream", "Indexes and reads multi-frame atomistic trajectories (.xyz, .extxyz, .traj, .h5, optionally .xz/.zst compressed)");

        options.add_options()
            ("help", "Print this message and exit")
            ("config", "ini file with [loader] settings and [mass] overrides", cxxopts::value<string>())
            ("index", "Always use streaming mode with a frame index")
            ("sample-rate", "Index (and plot metadata) every n-th frame", cxxopts::value<size_t>())
            ("initial-frames", "Frames decoded up front in streaming mode", cxxopts::value<size_t>())
            ("frame", "Load and print the given frame", cxxopts::value<size_t>())
            ("metadata", "Print the per-frame plot metadata")
            ("properties", "Restrict the plot metadata to these properties", cxxopts::value<vector<string>>())
            ("extract", "Print derived properties of the loaded frames: energy, forces, structure or all", cxxopts::value<string>())
            ("validate", "Check the parse result for consistency")
            ("files", "Trajectory files to process", cxxopts::value<vector<string>>())
            ;

        options.parse_positional({"files"});
        options.positional_help("files...");

        cxxopts::ParseResult parsed_arguments = options.parse(argc, argv);

        // Print help string and exit if required
        if(parsed_arguments.count("help"))
        {
            cerr << options.help() << endl;
            return 0;
        }

        if(parsed_arguments.count("files") == 0)
        {
            cerr << "No input files provided, exiting\n";
            return 1;
        }

        // load configuration file
        ConfigFilePtr pConfig;
        if(parsed_arguments.count("config"))
        {
            pConfig = make_shared<ConfigFile>();
            pConfig->open(parsed_arguments["config"].as<string>());

            // override / add masses (if any)
            if(pConfig->isSectionPresent("mass"))
                overwrite_dataset(library::Masses, pConfig, pConfig->getSection("mass"));
        }

        // command line beats config file
        StreamingOptions streaming = loader_options(pConfig);
        if(parsed_arguments.count("index"))
            streaming.bUseIndexing = true;
        if(parsed_arguments.count("sample-rate"))
            streaming.nIndexSampleRate = parsed_arguments["sample-rate"].as<size_t>();
        if(parsed_arguments.count("initial-frames"))
            streaming.nInitialFrames = parsed_arguments["initial-frames"].as<size_t>();

        DataExtractor extractor;
        if(parsed_arguments.count("extract"))
            extractor = extractor_by_name(parsed_arguments["extract"].as<string>());

        const auto files = parsed_arguments["files"].as<vector<string>>();
        bool bAllValid = true;
        for(const auto& file : files)
        {
            try 
            {
                auto t1 = chrono::high_resolution_clock::now();

                const string raw = readTrajectoryFile(file);
                const string sName = stripCompressionSuffix(file);

                auto future = parseTrajectoryAsync(raw, sName, [](const ParseProgress& progress) {
                    cerr << "\r" << static_cast<int>(progress.current) << "% " << progress.stage << "\033[K" << flush;
                }, streaming);
                const TrajectoryData data = future.get();
                cerr << "\n";

                auto t2 = chrono::high_resolution_clock::now();
                auto duration = chrono::duration_cast<chrono::milliseconds>(t2 - t1);

                cout << "== " << file << "\n";
                cout << "format:          " << get<string>(data.m_metadata.at("source_format")) << "\n";
                getTrajectoryStats(data).write(cout);
                cout << "parsing took " << static_cast<double>(duration.count()) / 1000.0 << " s\n";

                const FrameLoader loader = createFrameLoader(sName);

                if(parsed_arguments.count("frame"))
                {
                    const size_t nFrame = parsed_arguments["frame"].as<size_t>();
                    const FrameIndexList* pIndex = data.m_aIndexedFrames ? &*data.m_aIndexedFrames : nullptr;
                    if(auto pFrame = loader.loadFrame(raw, nFrame, pIndex))
                        print_frame(cout, *pFrame);
                    else
                        cout << "frame " << nFrame << " is not available\n";
                }

                if(parsed_arguments.count("metadata"))
                {
                    PlotMetadataOptions metadataOptions;
                    metadataOptions.nSampleRate = streaming.nIndexSampleRate;
                    if(parsed_arguments.count("properties"))
                        metadataOptions.aProperties = parsed_arguments["properties"].as<vector<string>>();
                    print_plot_metadata(cout, loader.extractPlotMetadata(raw, metadataOptions));
                }

                if(extractor)
                    print_extracted(cout, data, extractor);

                if(parsed_arguments.count("validate"))
                {
                    const auto aErrors = validateTrajectory(data);
                    for(const auto& sError : aErrors)
                        cout << "INVALID: " << sError << "\n";
                    if(aErrors.empty())
                        cout << "valid\n";
                    bAllValid = bAllValid && aErrors.empty();
                }
            }
            catch(const exception&)
            {
                THROW_WITH_NESTED(runtime_error, "Processing of \"", file, "\" failed");
            }
        }

        return bAllValid ? 0 : 2;
    }
    catch(exception& e)
    {
        print_nested_exception(cerr, e);
    }

    return 1;
}
