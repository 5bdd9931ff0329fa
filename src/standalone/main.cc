/**
 *   Copyright (C) 2012-2013 IFSTTAR (http://www.ifsttar.fr)
 *   Copyright (C) 2012-2013 Oslandia <infos@oslandia.com>
 *
 *   This library is free software; you can redistribute it and/or
 *   modify it under the terms of the GNU Library General Public
 *   License as published by the Free Software Foundation; either
 *   version 2 of the License, or (at your option) any later version.
 *
 *   This library is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 *   Library General Public License for more details.
 *   You should have received a copy of the GNU Library General Public
 *   License along with this library; if not, see <http://www.gnu.org/licenses/>.
 */

///
/// Command line front end of the coordinator
///

#include <boost/program_options.hpp>
#include <boost/thread.hpp>
#include <fstream>
#include <iostream>
#include <vector>
#include <iterator>
#include <algorithm>
#include <sstream>
#include <cstdlib>

#include "coordinator.hh"
#include "errors.hh"
#include "memory_cache.hh"
#include "memory_store.hh"
#include "pg_cache.hh"
#include "pg_store.hh"

using namespace std;
using namespace Rideshare;

namespace po = boost::program_options;

namespace {

const char* COMMANDS =
    "Commands:\n"
    "  submit            submit a request (--pickup, --dropoff, --passengers, --luggage, --max-detour)\n"
    "  match ID          rank the trip options of a request\n"
    "  book ID           book an option of a request (--choice)\n"
    "  start ID          start a trip\n"
    "  complete ID       complete a trip\n"
    "  cancel ID         cancel a trip\n"
    "  sweep             complete the expired trips (--interval to repeat)\n"
    "  surge             print the current surge factor\n"
    "  add-vehicle       register a vehicle (--location, --label, --max-passengers, --max-luggage)\n"
    "  show-request ID   print a request\n"
    "  show-trip ID      print a trip\n"
    "  init-db FILE      execute a SQL file (the schema) on the database\n";

Location to_location( const string& s )
{
    // "lat,lon"
    const size_t p = s.find( ',' );
    if ( p == string::npos ) {
        throw ValidationError( "Location expected as lat,lon, got " + s );
    }
    return Location( lexical_cast<double>( s.substr( 0, p ) ), lexical_cast<double>( s.substr( p + 1 ) ) );
}

db_id_t id_argument( const vector<string>& args )
{
    if ( args.size() < 2 ) {
        throw std::invalid_argument( "Missing identifier for command " + args[0] );
    }
    return lexical_cast<db_id_t>( args[1] );
}

void print_location( ostream& ostr, const Location& l )
{
    ostr << l.latitude() << "," << l.longitude();
    if ( !l.label().empty() ) {
        ostr << " (" << l.label() << ")";
    }
}

void print_request( const RideRequest& r )
{
    cout << "request " << r.db_id() << " [" << status_name( r.status() ) << ", version " << r.version() << "]" << endl;
    cout << "  requester: " << r.requester_id() << endl;
    cout << "  pickup: ";
    print_location( cout, r.pickup() );
    cout << endl << "  dropoff: ";
    print_location( cout, r.dropoff() );
    cout << endl;
    cout << "  passengers: " << r.passengers() << ", luggage units: " << r.luggage_units()
         << ", max detour: " << r.max_detour_minutes() << "min" << endl;
    cout << "  requested at: " << r.requested_at() << endl;
}

void print_trip( const Trip& t )
{
    if ( t.db_id() ) {
        cout << "trip " << t.db_id() << " [" << status_name( t.status() ) << ", version " << t.version() << "] vehicle " << t.vehicle_id() << endl;
    }
    cout << "  distance: " << t.total_distance() << "km, duration: " << t.estimated_duration() << "min" << endl;
    cout << "  price: " << t.base_price() << ", surge: " << t.surge_factor() << endl;
    for ( size_t i = 0; i < t.waypoints().size(); i++ ) {
        const Waypoint& w = t.waypoints()[i];
        cout << "  " << i << ". " << ( w.is_pickup() ? "pickup  " : "dropoff " ) << "request " << w.request_id() << " at ";
        print_location( cout, w.location() );
        cout << endl;
    }
    for ( const PassengerLeg& leg : t.legs() ) {
        cout << "  leg of request " << leg.request_id() << ": " << leg.passengers() << " passenger(s), "
             << leg.distance_km() << "km, fare " << leg.fare() << ", detour " << leg.detour_minutes() << "min" << endl;
    }
}

void print_matches( const MatchResultList& results )
{
    for ( size_t i = 0; i < results.size(); i++ ) {
        const MatchResult& m = results[i];
        cout << "option " << i << ( m.is_solo() ? " (solo)" : "" ) << ": score " << m.score
             << ", savings " << m.savings << ", max detour " << m.detour_minutes << "min" << endl;
        print_trip( m.trip );
    }
}

///
/// Reads an INI file whose sections are option prefixes, e.g.
/// [pricing]
/// base_fare = 5.0
void load_config_file( const string& path, Configuration& config )
{
    ifstream ifs( path.c_str() );
    if ( !ifs ) {
        throw std::runtime_error( "Cannot open configuration file " + path );
    }
    po::options_description none;
    po::parsed_options parsed = po::parse_config_file( ifs, none, /* allow_unregistered */ true );
    for ( const po::option& o : parsed.options ) {
        string name = o.string_key;
        std::replace( name.begin(), name.end(), '.', '/' );
        if ( o.value.empty() ) {
            continue;
        }
        config.set_option( name, Variant( o.value.front() ) );
    }
}

///
/// Parses option:type=value
void set_typed_option( const string& o, Configuration& config )
{
    const size_t p = o.find( '=' );
    if ( p == string::npos ) {
        throw std::invalid_argument( "Option expected as name:type=value, got " + o );
    }
    const string l = o.substr( 0, p );
    const string value = o.substr( p + 1 );
    const size_t p2 = l.find( ':' );
    const string option = l.substr( 0, p2 );
    const string type = p2 == string::npos ? "str" : l.substr( p2 + 1 );

    if ( type == "bool" ) {
        config.set_option( option, Variant::from_string( value, BoolVariant ) );
    }
    else if ( type == "int" ) {
        config.set_option( option, Variant::from_string( value, IntVariant ) );
    }
    else if ( type == "float" ) {
        config.set_option( option, Variant::from_string( value, FloatVariant ) );
    }
    else if ( type == "str" ) {
        config.set_option( option, Variant::from_string( value, StringVariant ) );
    }
    else {
        throw std::invalid_argument( "Unknown option type " + type );
    }
}

}

int main_( int argc, char* argv[] )
{
    po::options_description desc( "Allowed options" );
    desc.add_options()
        ( "help,h", "produce help message" )
        ( "db,d", po::value<string>(), "set database connection options" )
        ( "backend,b", po::value<string>(), "set the storage backend (pgsql or memory)" )
        ( "config,c", po::value<string>(), "read options from an INI file" )
        ( "option,o", po::value<vector<string>>()->multitoken(), "set options option:type=value (space separated)" )
        ( "requester", po::value<db_id_t>()->default_value( 0 ), "requester id (submit)" )
        ( "pickup", po::value<string>(), "pickup location lat,lon (submit)" )
        ( "pickup-label", po::value<string>(), "pickup address (submit)" )
        ( "dropoff", po::value<string>(), "dropoff location lat,lon (submit)" )
        ( "dropoff-label", po::value<string>(), "dropoff address (submit)" )
        ( "passengers", po::value<int>()->default_value( 1 ), "number of passengers (submit)" )
        ( "luggage", po::value<vector<int>>()->multitoken(), "luggage sizes, 1 to 3 (submit)" )
        ( "max-detour", po::value<int>()->default_value( DEFAULT_MAX_DETOUR_MINUTES ), "tolerated detour in minutes (submit)" )
        ( "choice", po::value<size_t>()->default_value( 0 ), "rank of the option to book (book)" )
        ( "interval", po::value<int>(), "repeat every N seconds (sweep)" )
        ( "location", po::value<string>(), "vehicle location lat,lon (add-vehicle)" )
        ( "label", po::value<string>(), "vehicle label (add-vehicle)" )
        ( "max-passengers", po::value<int>()->default_value( 4 ), "vehicle seats (add-vehicle)" )
        ( "max-luggage", po::value<int>()->default_value( 6 ), "vehicle luggage units (add-vehicle)" )
        ( "no-catch", "Debug mode, don't catch exceptions" )
        ;

    po::options_description hidden;
    hidden.add_options()
        ( "args", po::value<vector<string>>(), "command and its arguments" )
        ;
    po::options_description all;
    all.add( desc ).add( hidden );
    po::positional_options_description positional;
    positional.add( "args", -1 );

    po::variables_map vm;
    try {
        po::store( po::command_line_parser( argc, argv ).options( all ).positional( positional ).run(), vm );
    }
    catch ( po::error& e ) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    po::notify( vm );

    if ( vm.count( "help" ) || !vm.count( "args" ) ) {
        COUT << desc << "\n" << COMMANDS;
        return 1;
    }
    const vector<string> args = vm["args"].as<vector<string>>();
    const string& command = args[0];

    Configuration config;
    const char* env_db = getenv( "RIDESHARE_DB_OPTIONS" );
    if ( env_db ) {
        config.set_option( "db/options", Variant( string( env_db ) ) );
    }
    if ( vm.count( "config" ) ) {
        load_config_file( vm["config"].as<string>(), config );
    }
    if ( vm.count( "option" ) ) {
        for ( const string& o : vm["option"].as<vector<string>>() ) {
            set_typed_option( o, config );
        }
    }
    if ( vm.count( "db" ) ) {
        config.set_option( "db/options", Variant( vm["db"].as<string>() ) );
    }
    if ( vm.count( "backend" ) ) {
        config.set_option( "store/backend", Variant( vm["backend"].as<string>() ) );
    }

    const string backend = config.get_string_option( "store/backend" );
    const string db_options = config.get_string_option( "db/options" );

    if ( command == "init-db" ) {
        if ( args.size() < 2 ) {
            throw std::invalid_argument( "Missing SQL file" );
        }
        Db::Connection connection( db_options );
        execute_sql_file( connection, args[1] );
        COUT << "executed " << args[1] << endl;
        return 0;
    }

    std::unique_ptr<Store> store;
    std::unique_ptr<Cache> cache;
    if ( backend == "pgsql" ) {
        PgStore* pg_store = new PgStore( db_options, size_t( config.get_int_option( "store/pool_size" ) ) );
        store.reset( pg_store );
        cache.reset( new PgCache( pg_store->pool() ) );
    }
    else if ( backend == "memory" ) {
        COUT << "[WARNING] memory backend, nothing is kept after exit" << endl;
        store.reset( new MemoryStore() );
        cache.reset( new MemoryCache() );
    }
    else {
        throw std::invalid_argument( "Unknown backend " + backend );
    }

    Coordinator coordinator( *store, *cache, config );

    if ( command == "submit" ) {
        if ( !vm.count( "pickup" ) || !vm.count( "dropoff" ) ) {
            throw std::invalid_argument( "submit needs --pickup and --dropoff" );
        }
        RideRequest r;
        r.set_requester_id( vm["requester"].as<db_id_t>() );
        Location pickup = to_location( vm["pickup"].as<string>() );
        Location dropoff = to_location( vm["dropoff"].as<string>() );
        if ( vm.count( "pickup-label" ) ) {
            pickup.set_label( vm["pickup-label"].as<string>() );
        }
        if ( vm.count( "dropoff-label" ) ) {
            dropoff.set_label( vm["dropoff-label"].as<string>() );
        }
        r.set_pickup( pickup );
        r.set_dropoff( dropoff );
        r.set_passengers( vm["passengers"].as<int>() );
        if ( vm.count( "luggage" ) ) {
            r.set_luggage( vm["luggage"].as<vector<int>>() );
        }
        r.set_max_detour_minutes( vm["max-detour"].as<int>() );
        print_request( coordinator.submit_request( r ) );
    }
    else if ( command == "match" ) {
        print_matches( coordinator.find_matches( id_argument( args ) ) );
    }
    else if ( command == "book" ) {
        const db_id_t id = id_argument( args );
        const MatchResultList results = coordinator.find_matches( id );
        const size_t choice = vm["choice"].as<size_t>();
        if ( choice >= results.size() ) {
            throw std::invalid_argument( "No option " + to_string( choice ) + ", " + to_string( results.size() ) + " available" );
        }
        print_trip( coordinator.confirm_booking( id, results[choice] ) );
    }
    else if ( command == "start" ) {
        print_trip( coordinator.start_trip( id_argument( args ) ) );
    }
    else if ( command == "complete" ) {
        print_trip( coordinator.complete_trip( id_argument( args ) ) );
    }
    else if ( command == "cancel" ) {
        print_trip( coordinator.cancel_trip( id_argument( args ) ) );
    }
    else if ( command == "sweep" ) {
        if ( vm.count( "interval" ) ) {
            const int interval = vm["interval"].as<int>();
            if ( interval <= 0 ) {
                throw std::invalid_argument( "The interval must be positive" );
            }
            for ( ;; ) {
                coordinator.complete_expired_trips( now_utc() );
                boost::this_thread::sleep_for( boost::chrono::seconds( interval ) );
            }
        }
        cout << coordinator.complete_expired_trips( now_utc() ) << " trip(s) completed" << endl;
    }
    else if ( command == "surge" ) {
        cout << coordinator.current_surge_factor() << endl;
    }
    else if ( command == "add-vehicle" ) {
        if ( !vm.count( "location" ) ) {
            throw std::invalid_argument( "add-vehicle needs --location" );
        }
        Vehicle v;
        v.set_location( to_location( vm["location"].as<string>() ) );
        if ( vm.count( "label" ) ) {
            v.set_label( vm["label"].as<string>() );
        }
        v.set_max_passengers( vm["max-passengers"].as<int>() );
        v.set_max_luggage( vm["max-luggage"].as<int>() );
        cout << "vehicle " << coordinator.register_vehicle( v ) << endl;
    }
    else if ( command == "show-request" ) {
        print_request( coordinator.request( id_argument( args ) ) );
    }
    else if ( command == "show-trip" ) {
        print_trip( coordinator.trip( id_argument( args ) ) );
    }
    else {
        std::cerr << "Unknown command " << command << "\n" << COMMANDS;
        return 1;
    }

    return 0;
}

int main( int argc, char* argv[] )
{
    const std::vector<std::string> args{ argv, argv + argc };
    bool debug_mode = find( begin( args ), end( args ), "--no-catch" ) != end( args );

    if ( debug_mode ) {
        return main_( argc, argv );
    }
    else {
        try {
            return main_( argc, argv );
        }
        catch ( ValidationError& e ) {
            std::cerr << "Invalid input: " << e.what() << std::endl;
            return 2;
        }
        catch ( ConflictError& e ) {
            std::cerr << "Conflict: " << e.what() << std::endl;
            return 3;
        }
        catch ( NotFoundError& e ) {
            std::cerr << "Not found: " << e.what() << std::endl;
            return 4;
        }
        catch ( std::exception& e ) {
            std::cerr << "Exception: " << e.what() << std::endl;
        }
    }
    return 1;
}
