#include "harness.h"

#include <cmath>
#include <regex>
#include <limits>
#include <vector>
#include <algorithm>

#include <fmt/core.h>

namespace {

// Decode one code point at i and advance i. Malformed sequences, overlongs and
//   surrogates decode to U+FFFD, consuming a single byte.
char32_t DecodeUtf8(const std::string& str, size_t& i) {
  static const char32_t kMinCodePoint[] = {0, 0, 0x80, 0x800, 0x10000};
  unsigned char c = str[i];
  if (c < 0x80) {
    i++;
    return c;
  }
  size_t len;
  char32_t cp;
  if ((c & 0xe0) == 0xc0) {
    len = 2, cp = c & 0x1f;
  } else if ((c & 0xf0) == 0xe0) {
    len = 3, cp = c & 0x0f;
  } else if ((c & 0xf8) == 0xf0) {
    len = 4, cp = c & 0x07;
  } else {
    i++;
    return 0xfffd;
  }
  if (i + len > str.size()) {
    i++;
    return 0xfffd;
  }
  for (size_t k = 1; k < len; k++) {
    unsigned char nxt = str[i + k];
    if ((nxt & 0xc0) != 0x80) {
      i++;
      return 0xfffd;
    }
    cp = cp << 6 | (nxt & 0x3f);
  }
  if (cp < kMinCodePoint[len] || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
    i++;
    return 0xfffd;
  }
  i += len;
  return cp;
}

std::string Utf16Escape(char32_t cp) {
  if (cp < 0x10000) return fmt::format("\\u{:04x}", (uint32_t)cp);
  cp -= 0x10000;
  return fmt::format("\\u{:04x}\\u{:04x}", 0xd800 + (uint32_t)(cp >> 10), 0xdc00 + (uint32_t)(cp & 0x3ff));
}

// control characters and non-ASCII code points
std::string EscapeCodePoint(char32_t cp, Language lang) {
  uint32_t val = cp;
  switch (lang) {
    case Language::PYTHON: [[fallthrough]];
    case Language::GO:
      if (val < 0x80) return fmt::format("\\x{:02x}", val);
      if (val < 0x10000) return fmt::format("\\u{:04x}", val);
      return fmt::format("\\U{:08x}", val);
    case Language::JAVASCRIPT: [[fallthrough]];
    case Language::TYPESCRIPT:
      if (val < 0x80) return fmt::format("\\x{:02x}", val);
      return fmt::format("\\u{{{:x}}}", val);
    case Language::CPP:
      // non-ASCII bytes never reach here
      return fmt::format("\\{:03o}", val);
    case Language::JAVA:
      // \u escapes are translated before lexing, so they are only safe outside ASCII
      if (val < 0x80) return fmt::format("\\{:03o}", val);
      return Utf16Escape(cp);
    case Language::CSHARP:
      // \x takes a variable number of digits
      return Utf16Escape(cp);
    case Language::RUST:
      return fmt::format("\\u{{{:x}}}", val);
  }
  __builtin_unreachable();
}

std::string Quoted(const std::string& str, Language lang) {
  return '"' + EscapeStringLiteral(str, lang) + '"';
}

std::string ReplaceAll(std::string str, const std::string& from, const std::string& to) {
  for (size_t pos = 0; (pos = str.find(from, pos)) != std::string::npos; pos += to.size()) {
    str.replace(pos, from.size(), to);
  }
  return str;
}

// shortest representation that reads back to the same double
std::string FormatDouble(double val) {
  return fmt::format("{}", val);
}

// Numbers of a native literal: Integer/Long in Java, int/long in C#;
//   everything else (and every number in Rust) becomes a double.
enum class NumberKind { INT, LONG, ULONG, DOUBLE };

NumberKind ClassifyNumber(const nlohmann::json& val) {
  if (val.is_number_integer() && !val.is_number_unsigned()) {
    int64_t num = val.get<int64_t>();
    if (num >= std::numeric_limits<int32_t>::min() && num <= std::numeric_limits<int32_t>::max()) {
      return NumberKind::INT;
    }
    return NumberKind::LONG;
  }
  if (val.is_number_unsigned()) {
    uint64_t num = val.get<uint64_t>();
    if (num <= (uint64_t)std::numeric_limits<int32_t>::max()) return NumberKind::INT;
    if (num <= (uint64_t)std::numeric_limits<int64_t>::max()) return NumberKind::LONG;
    return NumberKind::ULONG;
  }
  return NumberKind::DOUBLE;
}

std::string IntegerText(const nlohmann::json& val) {
  if (val.is_number_unsigned()) return std::to_string(val.get<uint64_t>());
  return std::to_string(val.get<int64_t>());
}

template <class Func>
std::string Join(const nlohmann::json& val, Func&& func) {
  std::string ret;
  bool first = true;
  for (auto& [key, item] : val.items()) {
    if (!first) ret += ", ";
    first = false;
    ret += func(key, item);
  }
  return ret;
}

std::string JavaScalar(const nlohmann::json& val) {
  using value_t = nlohmann::json::value_t;
  switch (val.type()) {
    case value_t::boolean:
      return val.get<bool>() ? "true" : "false";
    case value_t::number_integer: [[fallthrough]];
    case value_t::number_unsigned: [[fallthrough]];
    case value_t::number_float:
      switch (ClassifyNumber(val)) {
        case NumberKind::INT: return IntegerText(val);
        case NumberKind::LONG: return IntegerText(val) + 'L';
        default: break;
      }
      if (!std::isfinite(val.get<double>())) return "null";
      return FormatDouble(val.get<double>()) + 'd';
    default:
      return "null";
  }
}

// A class file caps each method at 64 KiB of bytecode, each string constant at
//   64 KiB of modified UTF-8 and the constant pool at 65535 entries. The input is
//   built statement by statement into a shared slot array spread over small
//   classes; long strings are joined at run time from short constants.
constexpr size_t kJavaStringChunk = 4096;
constexpr size_t kJavaChunkCost = 1000;

class JavaInputBuilder {
  std::vector<std::string> chunks_;
  size_t cost_ = 0;
  size_t slots_ = 1;

  void Emit(const std::string& stmt) {
    size_t cost = 1 + stmt.size() / kJavaStringChunk;
    if (chunks_.empty() || (cost_ && cost_ + cost > kJavaChunkCost)) {
      chunks_.emplace_back();
      cost_ = 0;
    }
    chunks_.back() += "        " + stmt + "\n";
    cost_ += cost;
  }

  std::string StringExpr(const std::string& str) {
    if (str.size() <= kJavaStringChunk) return Quoted(str, Language::JAVA);
    std::string ret = "__Input.str(";
    for (size_t pos = 0; pos < str.size();) {
      size_t len = std::min(kJavaStringChunk, str.size() - pos);
      // never cut a UTF-8 sequence
      while (len > 1 && pos + len < str.size() && ((unsigned char)str[pos + len] & 0xc0) == 0x80) len--;
      if (pos) ret += ", ";
      ret += Quoted(str.substr(pos, len), Language::JAVA);
      pos += len;
    }
    return ret + ")";
  }

  // returns an expression evaluating to val once the emitted statements ran
  std::string Value(const nlohmann::json& val) {
    if (val.is_string()) return StringExpr(val.get_ref<const std::string&>());
    if (!val.is_array() && !val.is_object()) return JavaScalar(val);
    std::string ref = "v[" + std::to_string(slots_++) + "]";
    Emit(ref + (val.is_array() ? " = new ArrayList<Object>();" : " = new LinkedHashMap<String, Object>();"));
    for (auto& [key, item] : val.items()) {
      std::string elem = Value(item);
      if (val.is_array()) {
        Emit("__Input.add(" + ref + ", " + elem + ");");
      } else {
        Emit("__Input.put(" + ref + ", " + StringExpr(key) + ", " + elem + ");");
      }
    }
    return ref;
  }

 public:
  std::string Build(const nlohmann::json& input) {
    std::string root = Value(input);
    Emit("v[0] = " + root + ";");
    std::string ret = "\nfinal class __Input {\n"
        "    static final Object[] v = new Object[" + std::to_string(slots_) + "];\n"
        "    @SuppressWarnings(\"unchecked\")\n"
        "    static void add(Object list, Object item) { ((List<Object>) list).add(item); }\n"
        "    @SuppressWarnings(\"unchecked\")\n"
        "    static void put(Object map, String key, Object item) { ((Map<String, Object>) map).put(key, item); }\n"
        "    static String str(String... parts) { return String.join(\"\", parts); }\n"
        "    static Object get() {\n";
    for (size_t i = 0; i < chunks_.size(); i++) {
      ret += "        __Input" + std::to_string(i) + ".run();\n";
    }
    ret += "        return v[0];\n    }\n}\n";
    for (size_t i = 0; i < chunks_.size(); i++) {
      ret += "\nfinal class __Input" + std::to_string(i) + " {\n"
          "    static void run() {\n"
          "        Object[] v = __Input.v;\n" + chunks_[i] + "    }\n}\n";
    }
    return ret;
  }
};

std::string CSharpLiteral(const nlohmann::json& val) {
  using value_t = nlohmann::json::value_t;
  switch (val.type()) {
    case value_t::null: [[fallthrough]];
    case value_t::discarded: [[fallthrough]];
    case value_t::binary:
      return "null";
    case value_t::boolean:
      return val.get<bool>() ? "true" : "false";
    case value_t::number_integer: [[fallthrough]];
    case value_t::number_unsigned: [[fallthrough]];
    case value_t::number_float:
      switch (ClassifyNumber(val)) {
        case NumberKind::INT: return IntegerText(val);
        case NumberKind::LONG: return IntegerText(val) + 'L';
        case NumberKind::ULONG: return IntegerText(val) + "UL";
        case NumberKind::DOUBLE: break;
      }
      if (!std::isfinite(val.get<double>())) return "null";
      return FormatDouble(val.get<double>()) + 'd';
    case value_t::string:
      return Quoted(val.get_ref<const std::string&>(), Language::CSHARP);
    case value_t::array:
      if (val.empty()) return "new List<object>()";
      return "new List<object> { " + Join(val, [](const std::string&, const nlohmann::json& item) {
        return CSharpLiteral(item);
      }) + " }";
    case value_t::object:
      if (val.empty()) return "new Dictionary<string, object>()";
      return "new Dictionary<string, object> { " + Join(val, [](const std::string& key, const nlohmann::json& item) {
        return "{ " + Quoted(key, Language::CSHARP) + ", " + CSharpLiteral(item) + " }";
      }) + " }";
  }
  __builtin_unreachable();
}

std::string RustLiteral(const nlohmann::json& val) {
  using value_t = nlohmann::json::value_t;
  switch (val.type()) {
    case value_t::null: [[fallthrough]];
    case value_t::discarded: [[fallthrough]];
    case value_t::binary:
      return "Value::Null";
    case value_t::boolean:
      return val.get<bool>() ? "Value::Bool(true)" : "Value::Bool(false)";
    case value_t::number_integer: [[fallthrough]];
    case value_t::number_unsigned:
      return "Value::Number(" + IntegerText(val) + "f64)";
    case value_t::number_float:
      if (!std::isfinite(val.get<double>())) return "Value::Null";
      return "Value::Number(" + FormatDouble(val.get<double>()) + "f64)";
    case value_t::string:
      return "Value::String(String::from(" + Quoted(val.get_ref<const std::string&>(), Language::RUST) + "))";
    case value_t::array:
      return "Value::Array(vec![" + Join(val, [](const std::string&, const nlohmann::json& item) {
        return RustLiteral(item);
      }) + "])";
    case value_t::object:
      return "Value::Object(vec![" + Join(val, [](const std::string& key, const nlohmann::json& item) {
        return "(String::from(" + Quoted(key, Language::RUST) + "), " + RustLiteral(item) + ")";
      }) + "])";
  }
  __builtin_unreachable();
}

// Drop the first `package` clause (comments and blank lines may precede it)
std::string StripGoPackageClause(const std::string& code) {
  size_t pos = 0;
  while (pos < code.size()) {
    size_t eol = code.find('\n', pos);
    if (eol == std::string::npos) eol = code.size();
    size_t first = code.find_first_not_of(" \t\r", pos);
    if (first >= eol) {
      pos = eol + 1;
      continue;
    }
    if (code.compare(first, 2, "//") == 0) {
      pos = eol + 1;
      continue;
    }
    if (code.compare(first, 7, "package") == 0 && first + 7 < eol &&
        (code[first + 7] == ' ' || code[first + 7] == '\t')) {
      return code.substr(0, pos) + code.substr(std::min(eol + 1, code.size()));
    }
    break;
  }
  return code;
}

// Solution.java may hold only one public top-level class
std::string DemotePublicMain(const std::string& code) {
  static const std::regex kPublicMain(R"((^|\n)([ \t]*)public(\s+(?:final\s+)?class\s+Main\b))");
  return std::regex_replace(code, kPublicMain, "$1$2$3");
}

const char kScriptSuffix[] = R"ibench(

const __ibenchEntry = main;
const __ibenchInput = JSON.parse("%INPUT%");
Promise.resolve()
  .then(() => __ibenchEntry(__ibenchInput))
  .then(
    (result%ANY%) => JSON.stringify({ success: true, result }),
    (error%ANY%) => JSON.stringify({
      success: false,
      error: String(error && error.message !== undefined ? error.message : error),
    }),
  )
  .catch((error%ANY%) => JSON.stringify({ success: false, error: String(error) }))
  .then((output%ANY%) => {
    process.stdout.write(output + "\n");
  });
)ibench";

const char kPythonPrefix[] = R"ibench(import json as __ibench_json
import math as __ibench_math

)ibench";
const char kPythonSuffix[] = R"ibench(


# NaN and infinities have no JSON form; they become null
def __ibench_finite(value):
    if isinstance(value, float) and not __ibench_math.isfinite(value):
        return None
    if isinstance(value, dict):
        return {key: __ibench_finite(item) for key, item in value.items()}
    if isinstance(value, (list, tuple)):
        return [__ibench_finite(item) for item in value]
    return value


__ibench_entry = main
__ibench_input = __ibench_json.loads("%INPUT%")
try:
    __ibench_result = __ibench_finite(__ibench_entry(__ibench_input))
    __ibench_output = __ibench_json.dumps({"success": True, "result": __ibench_result}, allow_nan=False)
except Exception as __ibench_error:
    __ibench_output = __ibench_json.dumps({"success": False, "error": str(__ibench_error)})
print(__ibench_output, flush=True)
)ibench";

const char kGoPrefix[] = R"ibench(package main

import (
	__json "encoding/json"
	__fmt "fmt"
	__os "os"
)

)ibench";
const char kGoSuffix[] = R"ibench(

func main() {
	__entry := Main
	var __input interface{}
	if __err := __json.Unmarshal([]byte("%INPUT%"), &__input); __err != nil {
		__fmt.Fprintln(__os.Stderr, __err)
		__os.Exit(1)
	}
	__output := func() (out []byte) {
		defer func() {
			if r := recover(); r != nil {
				out, _ = __json.Marshal(map[string]interface{}{"success": false, "error": __fmt.Sprint(r)})
			}
		}()
		result := __entry(__input)
		out, err := __json.Marshal(map[string]interface{}{"success": true, "result": result})
		if err != nil {
			out, _ = __json.Marshal(map[string]interface{}{"success": false, "error": err.Error()})
		}
		return out
	}()
	__fmt.Println(string(__output))
}
)ibench";

const char kCppPrefix[] = R"ibench(#include <iostream>
#include <exception>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

)ibench";
const char kCppSuffix[] = R"ibench(

int main() {
  json ibench_input = json::parse("%INPUT%");
  json ibench_output;
  try {
    json ibench_result = main_solution(ibench_input);
    ibench_output = {{"success", true}, {"result", ibench_result}};
  } catch (const std::exception& e) {
    ibench_output = {{"success", false}, {"error", e.what()}};
  } catch (...) {
    ibench_output = {{"success", false}, {"error", "unknown exception"}};
  }
  std::cout << ibench_output.dump(-1, ' ', true, json::error_handler_t::replace) << std::endl;
}
)ibench";

const char kJavaPrefix[] = R"ibench(import java.util.*;

)ibench";
const char kJavaSuffix[] = R"ibench(

public class Solution {
    public static void main(String[] args) {
        Object input = __Input.get();
        String output;
        try {
            Object result = Main.main(input);
            output = "{\"success\":true,\"result\":" + __toJson(result) + "}";
        } catch (Throwable e) {
            String message = e.getMessage() != null ? e.getMessage() : e.toString();
            output = "{\"success\":false,\"error\":" + __quote(message) + "}";
        }
        System.out.println(output);
    }

    static String __quote(String s) {
        StringBuilder sb = new StringBuilder("\"");
        for (int i = 0; i < s.length(); i++) {
            char c = s.charAt(i);
            if (c == '"') sb.append("\\\"");
            else if (c == '\\') sb.append("\\\\");
            else if (c < 0x20 || c > 0x7e) sb.append(String.format("\\u%04x", (int) c));
            else sb.append(c);
        }
        return sb.append('"').toString();
    }

    static String __toJson(Object o) {
        if (o == null) return "null";
        if (o instanceof String || o instanceof Character) return __quote(o.toString());
        if (o instanceof Boolean) return o.toString();
        if (o instanceof Double || o instanceof Float) {
            double d = ((Number) o).doubleValue();
            if (Double.isNaN(d) || Double.isInfinite(d)) return "null";
            return Double.toString(d);
        }
        if (o instanceof Number) return o.toString();
        if (o instanceof Map) {
            StringBuilder sb = new StringBuilder("{");
            boolean first = true;
            for (Map.Entry<?, ?> e : ((Map<?, ?>) o).entrySet()) {
                if (!first) sb.append(',');
                first = false;
                sb.append(__quote(String.valueOf(e.getKey()))).append(':').append(__toJson(e.getValue()));
            }
            return sb.append('}').toString();
        }
        if (o instanceof Iterable) {
            StringBuilder sb = new StringBuilder("[");
            boolean first = true;
            for (Object item : (Iterable<?>) o) {
                if (!first) sb.append(',');
                first = false;
                sb.append(__toJson(item));
            }
            return sb.append(']').toString();
        }
        if (o.getClass().isArray()) {
            StringBuilder sb = new StringBuilder("[");
            int n = java.lang.reflect.Array.getLength(o);
            for (int i = 0; i < n; i++) {
                if (i > 0) sb.append(',');
                sb.append(__toJson(java.lang.reflect.Array.get(o, i)));
            }
            return sb.append(']').toString();
        }
        return __quote(o.toString());
    }
}
)ibench";

const char kCSharpPrefix[] = R"ibench(using System;
using System.Collections;
using System.Collections.Generic;
using System.Globalization;
using System.Text;

)ibench";
const char kCSharpSuffix[] = R"ibench(

public class Program {
    public static void Main() {
        object input = %INPUT%;
        string output;
        try {
            object result = Solution.Main(input);
            output = "{\"success\":true,\"result\":" + ToJson(result) + "}";
        } catch (Exception e) {
            output = "{\"success\":false,\"error\":" + Quote(e.Message) + "}";
        }
        Console.Out.Write(output + "\n");
        Console.Out.Flush();
    }

    static string Quote(string s) {
        var sb = new StringBuilder("\"");
        foreach (char c in s) {
            if (c == '"') sb.Append("\\\"");
            else if (c == '\\') sb.Append("\\\\");
            else if (c < 0x20 || c > 0x7e) sb.Append("\\u").Append(((int)c).ToString("x4"));
            else sb.Append(c);
        }
        return sb.Append('"').ToString();
    }

    static string ToJson(object o) {
        if (o == null) return "null";
        if (o is string || o is char) return Quote(o.ToString());
        if (o is bool) return (bool)o ? "true" : "false";
        if (o is double || o is float || o is decimal) {
            double d = Convert.ToDouble(o, CultureInfo.InvariantCulture);
            if (double.IsNaN(d) || double.IsInfinity(d)) return "null";
            return d.ToString("R", CultureInfo.InvariantCulture);
        }
        if (o is sbyte || o is byte || o is short || o is ushort ||
            o is int || o is uint || o is long || o is ulong) {
            return Convert.ToString(o, CultureInfo.InvariantCulture);
        }
        if (o is IDictionary) {
            var sb = new StringBuilder("{");
            bool first = true;
            foreach (DictionaryEntry entry in (IDictionary)o) {
                if (!first) sb.Append(',');
                first = false;
                sb.Append(Quote(Convert.ToString(entry.Key, CultureInfo.InvariantCulture)));
                sb.Append(':').Append(ToJson(entry.Value));
            }
            return sb.Append('}').ToString();
        }
        if (o is IEnumerable) {
            var sb = new StringBuilder("[");
            bool first = true;
            foreach (object item in (IEnumerable)o) {
                if (!first) sb.Append(',');
                first = false;
                sb.Append(ToJson(item));
            }
            return sb.Append(']').ToString();
        }
        return Quote(o.ToString());
    }
}
)ibench";

const char kRustPrefix[] = R"ibench(#[allow(dead_code)]
#[derive(Clone, Debug, PartialEq)]
pub enum Value {
    Null,
    Bool(bool),
    Number(f64),
    String(String),
    Array(Vec<Value>),
    Object(Vec<(String, Value)>),
}

#[allow(dead_code)]
impl Value {
    pub fn is_null(&self) -> bool {
        matches!(self, Value::Null)
    }
    pub fn as_bool(&self) -> Option<bool> {
        if let Value::Bool(b) = self { Some(*b) } else { None }
    }
    pub fn as_f64(&self) -> Option<f64> {
        if let Value::Number(n) = self { Some(*n) } else { None }
    }
    pub fn as_i64(&self) -> Option<i64> {
        self.as_f64().map(|n| n as i64)
    }
    pub fn as_str(&self) -> Option<&str> {
        if let Value::String(s) = self { Some(s.as_str()) } else { None }
    }
    pub fn as_array(&self) -> Option<&Vec<Value>> {
        if let Value::Array(a) = self { Some(a) } else { None }
    }
    pub fn get(&self, key: &str) -> Option<&Value> {
        if let Value::Object(m) = self {
            m.iter().find(|(k, _)| k == key).map(|(_, v)| v)
        } else {
            None
        }
    }
    fn write_json(&self, out: &mut String) {
        match self {
            Value::Null => out.push_str("null"),
            Value::Bool(b) => out.push_str(if *b { "true" } else { "false" }),
            Value::Number(n) => {
                if !n.is_finite() {
                    out.push_str("null");
                } else if n.fract() == 0.0 && n.abs() < 1e15 {
                    out.push_str(&format!("{}", *n as i64));
                } else {
                    out.push_str(&format!("{}", n));
                }
            }
            Value::String(s) => ibench_quote(s, out),
            Value::Array(a) => {
                out.push('[');
                for (i, v) in a.iter().enumerate() {
                    if i > 0 { out.push(','); }
                    v.write_json(out);
                }
                out.push(']');
            }
            Value::Object(m) => {
                out.push('{');
                for (i, (k, v)) in m.iter().enumerate() {
                    if i > 0 { out.push(','); }
                    ibench_quote(k, out);
                    out.push(':');
                    v.write_json(out);
                }
                out.push('}');
            }
        }
    }
}

fn ibench_quote(s: &str, out: &mut String) {
    out.push('"');
    for c in s.chars() {
        match c {
            '"' => out.push_str("\\\""),
            '\\' => out.push_str("\\\\"),
            c if (c as u32) < 0x20 => out.push_str(&format!("\\u{:04x}", c as u32)),
            c => out.push(c),
        }
    }
    out.push('"');
}

)ibench";
const char kRustSuffix[] = R"ibench(

fn main() {
    let entry: fn(Value) -> Value = main_solution;
    let input: Value = %INPUT%;
    std::panic::set_hook(Box::new(|_| {}));
    let mut out = String::new();
    match std::panic::catch_unwind(move || entry(input)) {
        Ok(result) => {
            out.push_str("{\"success\":true,\"result\":");
            result.write_json(&mut out);
        }
        Err(e) => {
            let msg = if let Some(s) = e.downcast_ref::<&str>() {
                s.to_string()
            } else if let Some(s) = e.downcast_ref::<String>() {
                s.clone()
            } else {
                String::from("panic")
            };
            out.push_str("{\"success\":false,\"error\":");
            ibench_quote(&msg, &mut out);
        }
    }
    out.push('}');
    println!("{}", out);
}
)ibench";

// the candidate goes between prefix and suffix; %INPUT% is substituted last
//   so candidate text is never scanned for placeholders
std::string Assemble(const std::string& prefix, const std::string& code,
                     const std::string& suffix, const std::string& input) {
  return prefix + code + ReplaceAll(suffix, "%INPUT%", input);
}

} // namespace

std::string EscapeStringLiteral(const std::string& str, Language lang) {
  std::string ret;
  ret.reserve(str.size());
  for (size_t i = 0; i < str.size();) {
    if ((unsigned char)str[i] >= 0x80 && lang == Language::CPP) {
      ret += fmt::format("\\{:03o}", (unsigned)(unsigned char)str[i]);
      i++;
      continue;
    }
    char32_t cp = DecodeUtf8(str, i);
    switch (cp) {
      case '"': ret += "\\\""; continue;
      case '\\': ret += "\\\\"; continue;
      case '\n': ret += "\\n"; continue;
      case '\r': ret += "\\r"; continue;
      case '\t': ret += "\\t"; continue;
    }
    if (cp >= 0x20 && cp < 0x7f) {
      ret += (char)cp;
    } else {
      ret += EscapeCodePoint(cp, lang);
    }
  }
  return ret;
}

std::string AsciiJson(const nlohmann::json& val) {
  return val.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

std::string ScriptHarness(const std::string& code, const nlohmann::json& input, bool typescript) {
  const Language lang = typescript ? Language::TYPESCRIPT : Language::JAVASCRIPT;
  return Assemble("", code, ReplaceAll(kScriptSuffix, "%ANY%", typescript ? ": any" : ""),
                  EscapeStringLiteral(AsciiJson(input), lang));
}

std::string PythonHarness(const std::string& code, const nlohmann::json& input) {
  return Assemble(kPythonPrefix, code, kPythonSuffix,
                  EscapeStringLiteral(AsciiJson(input), Language::PYTHON));
}

std::string GoHarness(const std::string& code, const nlohmann::json& input) {
  return Assemble(kGoPrefix, StripGoPackageClause(code), kGoSuffix,
                  EscapeStringLiteral(AsciiJson(input), Language::GO));
}

std::string CppHarness(const std::string& code, const nlohmann::json& input) {
  return Assemble(kCppPrefix, code, kCppSuffix,
                  EscapeStringLiteral(AsciiJson(input), Language::CPP));
}

std::string JavaHarness(const std::string& code, const nlohmann::json& input) {
  return Assemble(kJavaPrefix, DemotePublicMain(code), kJavaSuffix, "") + JavaInputBuilder().Build(input);
}

std::string CSharpHarness(const std::string& code, const nlohmann::json& input) {
  return Assemble(kCSharpPrefix, code, kCSharpSuffix, CSharpLiteral(input));
}

std::string RustHarness(const std::string& code, const nlohmann::json& input) {
  return Assemble(kRustPrefix, code, kRustSuffix, RustLiteral(input));
}
