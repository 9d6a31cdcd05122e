// Copyright Global Phasing Ltd.
//
// Reading atom-type tables. The format is a subset of CIF 1.1:
//
//   data_oplsaa
//   loop_
//   _atomtype.name
//   _atomtype.class
//   _atomtype.element
//   _atomtype.def
//   _atomtype.overrides
//   opls_135 CT C [C;D4]([H])([H])([H]) .
//   opls_138 CT C [C;D4]([H])([H])([H])[H] opls_135
//
// Values are unquoted or quoted with ' or ". Unquoted . and ? mean
// that the value is not given. Text fields, save frames and multiple
// blocks are not supported.

#include <moltype/forcefield.hpp>
#include <cstdlib>               // for strtod
#include <tao/pegtl.hpp>
#include <moltype/fail.hpp>      // for fail
#include <moltype/fileutil.hpp>  // for path_basename
#include <moltype/util.hpp>      // for split_str, trim_str

namespace moltype {

namespace pegtl = tao::pegtl;

namespace {

struct TableState {
  std::string block_name;
  std::vector<std::string> tags;
  std::vector<std::string> values;
  std::vector<size_t> value_lines;
};

} // anonymous namespace

namespace table_rules {

  using namespace pegtl;

  struct ws_char : one<' ', '\n', '\r', '\t'> {};
  struct nonblank_ch : range<'!', '~'> {};

  struct comment : if_must<one<'#'>, until<eolf>> {};
  struct whitespace : pegtl::plus<sor<ws_char, comment>> {};
  struct ws_or_eof : sor<whitespace, pegtl::eof> {};

  struct str_data : TAOCPP_PEGTL_ISTRING("data_") {};
  struct str_loop : TAOCPP_PEGTL_ISTRING("loop_") {};
  struct keyword : sor<str_data, str_loop> {};

  template<typename Q>
  struct endq : seq<Q, at<sor<one<' ', '\n', '\r', '\t', '#'>, pegtl::eof>>> {};
  template<typename Q> struct quoted_tail : until<endq<Q>, not_one<'\n'>> {};
  template<typename Q> struct quoted : if_must<Q, quoted_tail<Q>> {};
  struct singlequoted : quoted<one<'\''>> {};
  struct doublequoted : quoted<one<'"'>> {};
  struct unquoted : seq<not_at<keyword>, not_at<one<'_', '#'>>,
                        pegtl::plus<nonblank_ch>> {};
  struct value : sor<singlequoted, doublequoted, unquoted> {};

  struct blockname : pegtl::plus<nonblank_ch> {};
  struct heading : seq<str_data, blockname> {};
  struct tag : seq<one<'_'>, pegtl::plus<nonblank_ch>> {};
  struct loop_tag : tag {};
  struct loop_value : value {};
  struct loop : if_must<str_loop,
                        whitespace,
                        pegtl::plus<seq<loop_tag, whitespace, discard>>,
                        star<seq<loop_value, ws_or_eof, discard>>> {};
  struct file : must<opt<whitespace>, opt<heading, ws_or_eof>,
                     loop, pegtl::eof> {};


  // **** error messages ****

  template<typename Rule> const std::string& error_message() {
    static const std::string s = "parse error";
    return s;
  }
#define error_msg(rule, msg) \
  template<> inline const std::string& error_message<rule>() { \
    static const std::string s = msg; \
    return s; \
  }
  error_msg(quoted_tail<one<'\''>>, "unterminated 'string'")
  error_msg(quoted_tail<one<'"'>>, "unterminated \"string\"")
  error_msg(loop, "expected loop_ with atom types")
  error_msg(pegtl::plus<seq<loop_tag, whitespace, discard>>, "expected tags after loop_")
  error_msg(whitespace, "expected whitespace")
  error_msg(pegtl::eof, "expected a value or end of file")
#undef error_msg

  template<typename Rule> struct Errors : public pegtl::normal<Rule> {
    template<typename Input, typename ... States>
    static void raise(const Input& in, States&& ...) {
      throw pegtl::parse_error(error_message<Rule>(), in);
    }
  };

  // **** parsing actions ****

  template<typename Rule> struct Action : pegtl::nothing<Rule> {};

  template<> struct Action<blockname> {
    template<typename Input> static void apply(const Input& in, TableState& s) {
      s.block_name = in.string();
    }
  };
  template<> struct Action<loop_tag> {
    template<typename Input> static void apply(const Input& in, TableState& s) {
      s.tags.push_back(in.string());
    }
  };
  template<> struct Action<loop_value> {
    template<typename Input> static void apply(const Input& in, TableState& s) {
      s.values.push_back(in.string());
      s.value_lines.push_back(in.iterator().line);
    }
  };
  template<> struct Action<loop> {
    template<typename Input> static void apply(const Input& in, TableState& s) {
      if (s.values.size() % s.tags.size() != 0)
        throw pegtl::parse_error("Wrong number of values in the loop", in);
    }
  };

} // namespace table_rules

namespace {

bool is_null(const std::string& raw) {
  return raw.size() == 1 && (raw[0] == '.' || raw[0] == '?');
}

std::string as_string(const std::string& raw) {
  if (raw.size() >= 2 && (raw[0] == '\'' || raw[0] == '"'))
    return raw.substr(1, raw.size() - 2);
  return raw;
}

enum Column { Name, Class, Elem, Mass, Def, Overrides, Desc, NColumns };

const char* column_names[NColumns] = {
  "name", "class", "element", "mass", "def", "overrides", "desc"
};

ForceField make_forcefield(TableState& state, const std::string& source) {
  const std::string prefix = "_atomtype.";
  int positions[NColumns];
  for (int& p : positions)
    p = -1;
  for (size_t i = 0; i != state.tags.size(); ++i) {
    const std::string& tag = state.tags[i];
    if (tag.compare(0, prefix.size(), prefix) != 0)
      fail(source, ": unexpected tag ", tag, ", expected ", prefix, "*");
    for (int col = 0; col != NColumns; ++col)
      if (tag.compare(prefix.size(), std::string::npos, column_names[col]) == 0) {
        if (positions[col] != -1)
          fail(source, ": duplicated tag ", tag);
        positions[col] = (int) i;
      }
  }
  if (positions[Name] == -1)
    fail(source, ": missing tag ", prefix, "name");

  ForceField ff;
  ff.name = state.block_name.empty() ? path_basename(source, {".cif"})
                                     : state.block_name;
  size_t width = state.tags.size();
  for (size_t row = 0; row != state.values.size(); row += width) {
    size_t line = state.value_lines[row];
    auto value = [&](Column col) -> std::string {
      if (positions[col] == -1)
        return std::string();
      const std::string& raw = state.values[row + positions[col]];
      return is_null(raw) ? std::string() : as_string(raw);
    };
    auto row_fail = [&](const std::string& msg) {
      fail(source, ":", std::to_string(line), ": ", msg);
    };
    AtomTypeDef def;
    def.name = value(Name);
    if (def.name.empty())
      row_fail("atom type without a name");
    def.atom_class = value(Class);
    std::string elem = value(Elem);
    if (!elem.empty()) {
      def.element = Element(elem);
      if (def.element == El::X)
        row_fail("unknown element " + elem + " in " + def.name);
    }
    std::string mass = value(Mass);
    if (mass.empty()) {
      def.mass = def.element.weight();
    } else {
      char* endptr = nullptr;
      def.mass = std::strtod(mass.c_str(), &endptr);
      if (endptr == mass.c_str() || *endptr != '\0')
        row_fail("invalid mass " + mass + " in " + def.name);
    }
    def.definition = value(Def);
    std::string overrides = value(Overrides);
    if (!overrides.empty())
      for (const std::string& item : split_str(overrides, ',')) {
        std::string other = trim_str(item);
        if (!other.empty())
          def.overrides.insert(other);
      }
    def.description = value(Desc);
    try {
      ff.registry.register_atom_type(std::move(def));
    } catch (std::runtime_error& e) {
      row_fail(e.what());
    }
  }
  return ff;
}

template<typename Input> ForceField read_table(Input&& in) {
  TableState state;
  pegtl::parse<table_rules::file, table_rules::Action,
               table_rules::Errors>(in, state);
  return make_forcefield(state, in.source());
}

} // anonymous namespace

ForceField read_forcefield_file(const std::string& path) {
  pegtl::file_input<> in(path);
  return read_table(in);
}

ForceField read_forcefield_string(const std::string& text,
                                  const std::string& source) {
  pegtl::memory_input<> in(text, source);
  return read_table(in);
}

} // namespace moltype
