#include <modeldiff/encodings/yaml.h>

#include <boost/lexical_cast.hpp>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

#include <modeldiff/utilities/text.h>

namespace modeldiff {

// YAML I/O

// Read a YAML value into a dynamic.
static dynamic
read_yaml_value(YAML::Node const& yaml)
{
    switch (yaml.Type())
    {
        case YAML::NodeType::Null:
        default: // to avoid warnings
            return nil;
        case YAML::NodeType::Scalar: {
            // This case captures strings, booleans, integers, and doubles.
            // Explicitly quoted values are always strings.
            auto s = yaml.as<string>();
            if (yaml.Tag() == "!")
                return s;
            // Try to interpret it as a boolean.
            if (s == "true")
                return true;
            if (s == "false")
                return false;
            // Try to interpret it as a number.
            {
                integer i;
                if (boost::conversion::try_lexical_convert(s, i))
                {
                    return i;
                }
            }
            {
                double d;
                if (boost::conversion::try_lexical_convert(s, d))
                {
                    return d;
                }
            }
            // If all else fails, it must just be a string.
            return s;
        }
        case YAML::NodeType::Sequence: {
            dynamic_array array;
            array.reserve(yaml.size());
            for (auto const& i : yaml)
            {
                array.push_back(read_yaml_value(i));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            dynamic_map map;
            for (YAML::Node::const_iterator i = yaml.begin(); i != yaml.end();
                 ++i)
            {
                map[read_yaml_value(i->first)] = read_yaml_value(i->second);
            }
            return map;
        }
    }
}

dynamic
parse_yaml_value(char const* yaml, size_t length)
{
    YAML::Node parsed_yaml;
    try
    {
        parsed_yaml = YAML::Load(string(yaml, yaml + length));
    }
    catch (std::exception& e)
    {
        MODELDIFF_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(string(yaml, yaml + length))
                            << parsing_error_info(e.what()));
    }
    return read_yaml_value(parsed_yaml);
}

static void
emit_string(YAML::Emitter& out, string const& s)
{
    if (read_yaml_value(YAML::Node(s)).type() != value_type::STRING)
    {
        // This happens to be a string that looks like some other scalar type,
        // so it should be explicitly quoted.
        out << YAML::DoubleQuoted << s;
    }
    else
    {
        out << s;
    }
}

static void
emit_yaml_value(YAML::Emitter& out, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            out << YAML::Null;
            break;
        case value_type::BOOLEAN:
            out << cast<bool>(v);
            break;
        case value_type::INTEGER:
            out << cast<integer>(v);
            break;
        case value_type::FLOAT:
            out << cast<double>(v);
            break;
        case value_type::STRING:
            emit_string(out, cast<string>(v));
            break;
        case value_type::ARRAY: {
            out << YAML::BeginSeq;
            for (auto const& i : cast<dynamic_array>(v))
            {
                emit_yaml_value(out, i);
            }
            out << YAML::EndSeq;
            break;
        }
        case value_type::MAP: {
            out << YAML::BeginMap;
            for (auto const& i : cast<dynamic_map>(v))
            {
                emit_yaml_value(out << YAML::Key, i.first);
                emit_yaml_value(out << YAML::Value, i.second);
            }
            out << YAML::EndMap;
            break;
        }
    }
}

string
value_to_yaml(dynamic const& v)
{
    YAML::Emitter out;
    out << YAML::FloatPrecision(5);
    out << YAML::DoublePrecision(12);
    emit_yaml_value(out, v);
    return out.c_str();
}

static void
emit_diagnostic_yaml_value(YAML::Emitter& out, dynamic const& v)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            out << YAML::Null;
            break;
        case value_type::BOOLEAN:
            out << cast<bool>(v);
            break;
        case value_type::INTEGER:
            out << cast<integer>(v);
            break;
        case value_type::FLOAT:
            out << cast<double>(v);
            break;
        case value_type::STRING:
            emit_string(out, cast<string>(v));
            break;
        case value_type::ARRAY: {
            dynamic_array const& array = cast<dynamic_array>(v);
            if (array.size() < 64)
            {
                out << YAML::BeginSeq;
                for (auto const& i : array)
                {
                    emit_diagnostic_yaml_value(out, i);
                }
                out << YAML::EndSeq;
            }
            else
            {
                out << "<array - size: " + lexical_cast<string>(array.size())
                           + ">";
            }
            break;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            if (x.size() < 64)
            {
                out << YAML::BeginMap;
                for (auto const& i : x)
                {
                    emit_diagnostic_yaml_value(out << YAML::Key, i.first);
                    emit_diagnostic_yaml_value(out << YAML::Value, i.second);
                }
                out << YAML::EndMap;
            }
            else
            {
                out << "<map - size: " + lexical_cast<string>(x.size()) + ">";
            }
            break;
        }
    }
}

string
value_to_diagnostic_yaml(dynamic const& v)
{
    YAML::Emitter out;
    out << YAML::FloatPrecision(5);
    out << YAML::DoublePrecision(12);
    emit_diagnostic_yaml_value(out, v);
    return out.c_str();
}

} // namespace modeldiff
