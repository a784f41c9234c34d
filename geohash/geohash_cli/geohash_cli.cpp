#include "geohash/geohash.hpp"
#include "geohash/geohash_exceptions.hpp"
#include "geohash/geohash_json.hpp"

#include "base/logging.hpp"

#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

using namespace geohash;
using namespace std;

namespace po = boost::program_options;

namespace
{
struct CliCommandOptions
{
  boost::optional<double> m_lon;
  boost::optional<double> m_lat;
  // Signed, so that a negative value is reported instead of wrapping around.
  int m_precision = static_cast<int>(kDefaultPrecision);
  string m_decode;
  string m_geotype;
  bool m_json = false;
  string m_neighbors;
  string m_parent;
  string m_children;
  string m_logLevel;
  bool m_help = false;
};

void PrintNeighbors(vector<string> const & cells)
{
  // Neighbors() goes column by column, print row by row from north to south.
  size_t const kSide = 3;
  for (size_t row = 0; row < kSide; ++row)
  {
    for (size_t column = 0; column < kSide; ++column)
      cout << (column == 0 ? "" : " ") << cells[column * kSide + row];
    cout << endl;
  }
}

void PrintLines(vector<string> const & lines)
{
  for (auto const & line : lines)
    cout << line << endl;
}

int Run(CliCommandOptions const & o)
{
  if (o.m_lon || o.m_lat)
  {
    if (!o.m_lon || !o.m_lat)
    {
      cerr << "ERROR: --lon and --lat go together" << endl;
      return 1;
    }
    if (o.m_precision < 1)
      MYTHROW(InvalidPrecisionException, ("Precision must be at least 1, got", o.m_precision));
    cout << Encode(*o.m_lon, *o.m_lat, static_cast<size_t>(o.m_precision)) << endl;
    return 0;
  }

  if (!o.m_decode.empty())
  {
    DecodedCell const cell = Decode(o.m_decode);
    LOG(LDEBUG, ("Decoded", o.m_decode, "to", cell));
    if (o.m_json)
      cout << ToGeoJson(o.m_decode, cell) << endl;
    else
      cout << ToString(cell, GeoTypeFromString(o.m_geotype)) << endl;
    return 0;
  }

  if (!o.m_neighbors.empty())
  {
    PrintNeighbors(Neighbors(o.m_neighbors));
    return 0;
  }

  if (!o.m_parent.empty())
  {
    cout << Parent(o.m_parent) << endl;
    return 0;
  }

  if (!o.m_children.empty())
  {
    PrintLines(Children(o.m_children));
    return 0;
  }

  cerr << "ERROR: nothing to do, see --help" << endl;
  return 1;
}

CliCommandOptions DefineOptions(int argc, char * argv[])
{
  CliCommandOptions o;
  po::options_description optionsDescription("Usage: geohash_cli [options]. Pass negative "
                                             "coordinates as --lon=-122.3493");

  optionsDescription.add_options()
    ("lon", po::value<double>(), "Longitude of the point to encode, degrees in [-180, 180]")
    ("lat", po::value<double>(), "Latitude of the point to encode, degrees in [-90, 90]")
    ("precision", po::value(&o.m_precision)->default_value(o.m_precision),
     "Number of symbols of the encoded geohash")
    ("decode", po::value(&o.m_decode)->default_value(""), "Geohash to decode")
    ("geotype", po::value(&o.m_geotype)->default_value("point"),
     "View of the decoded cell: point, pointerr or polygon")
    ("json", po::bool_switch(&o.m_json), "Print the decoded cell as a GeoJSON feature")
    ("neighbors", po::value(&o.m_neighbors)->default_value(""),
     "Geohash to print the 3x3 block of cells around")
    ("parent", po::value(&o.m_parent)->default_value(""), "Geohash to print the parent of")
    ("children", po::value(&o.m_children)->default_value(""), "Geohash to print the children of")
    ("log_level", po::value(&o.m_logLevel)->default_value("WARNING"),
     "DEBUG, INFO, WARNING, ERROR or CRITICAL")
    ("help", "produce help message");

  po::variables_map vm;

  po::store(po::parse_command_line(argc, argv, optionsDescription), vm);
  po::notify(vm);

  if (vm.count("help"))
  {
    std::cout << optionsDescription << std::endl;
    o.m_help = true;
  }

  if (vm.count("lon"))
    o.m_lon = vm["lon"].as<double>();
  if (vm.count("lat"))
    o.m_lat = vm["lat"].as<double>();

  return o;
}
}  // namespace

int main(int argc, char * argv[])
{
  ios_base::sync_with_stdio(false);
  CliCommandOptions options;
  try
  {
    options = DefineOptions(argc, argv);
  }
  catch (po::error & e)
  {
    std::cerr << "ERROR: " << e.what() << std::endl << std::endl;
    return 1;
  }

  if (options.m_help)
    return 1;

  base::LogLevel level;
  if (!base::FromString(options.m_logLevel, level))
  {
    std::cerr << "ERROR: unknown log level " << options.m_logLevel << std::endl;
    return 1;
  }
  base::g_LogLevel = level;

  try
  {
    return Run(options);
  }
  catch (GeohashException const & e)
  {
    LOG(LERROR, (e.Msg()));
    return 1;
  }
}
