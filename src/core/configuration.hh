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

#ifndef RIDESHARE_CONFIGURATION_HH
#define RIDESHARE_CONFIGURATION_HH

#include <map>
#include <string>
#include <boost/variant.hpp>

#include "common.hh"

namespace Rideshare {

///
/// Variant type
enum VariantType {
    BoolVariant,
    IntVariant,
    FloatVariant, // stored as a double
    StringVariant
};

///
/// class Variant
/// Used to store option values
class Variant {
public:
    Variant();
    explicit Variant( bool b );
    explicit Variant( int i );
    explicit Variant( int64_t i );
    explicit Variant( double f );
    explicit Variant( const std::string& s );
    explicit Variant( const char* s );

    // return a string representation
    std::string str() const;
    VariantType type() const;

    ///
    /// Parses a string into a value of the given type
    /// @throws bad_lexical_cast if the string does not represent such a value
    static Variant from_string( const std::string& s, VariantType = StringVariant );

    template <typename T>
    T as() const {
        T v;
        convert_to( v );
        return v;
    }
private:
    typedef boost::variant<bool, int64_t, double, std::string> ValueT;
    ValueT v_;

    void convert_to( bool& b ) const;
    void convert_to( int64_t& i ) const;
    void convert_to( double& f ) const;
    void convert_to( std::string& s ) const;
};

typedef std::map<std::string, Variant> VariantMap;

///
/// Option description
struct OptionDescription {
    std::string description;
    Variant default_value;
    VariantType type() const {
        return default_value.type();
    }
};

struct OptionDescriptionList : public std::map<std::string, OptionDescription>
{
    ///
    /// Declares an option with its default value
    void declare_option( const std::string& nname, const std::string& description, const Variant& default_value ) {
        ( *this )[nname].description = description;
        ( *this )[nname].default_value = default_value;
    }
};

/**
   Runtime configuration.

   Every option has to be declared in option_descriptions(), with its default value.
   Values set by the user override the defaults. The object is built once by the
   composition root and passed by reference to the components.
*/
class Configuration
{
public:
    ///
    /// Construct a configuration, with optional overriding values
    /// @throws std::invalid_argument if an option is not declared
    explicit Configuration( const VariantMap& options = VariantMap() );

    ///
    /// All the options known by the library, with their defaults
    static const OptionDescriptionList& option_descriptions();

    ///
    /// Sets an option value. The value is converted to the declared type.
    /// @throws std::invalid_argument if the option is not declared
    void set_option( const std::string& name, const Variant& value );

    ///
    /// Gets an option value, or its default value if unset
    Variant option( const std::string& name ) const;

    bool get_bool_option( const std::string& name ) const;
    int64_t get_int_option( const std::string& name ) const;
    double get_float_option( const std::string& name ) const;
    std::string get_string_option( const std::string& name ) const;

    const VariantMap& options() const { return options_; }

private:
    VariantMap options_;
};

} // Rideshare

#endif
