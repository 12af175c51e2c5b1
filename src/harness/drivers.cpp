/**
 * @file drivers.cpp
 * @brief Embedded driver sources.
 */

#include "harness/drivers.hpp"

namespace sandbox_gate {

namespace {

constexpr std::string_view kPythonDriver = R"PY(import ast
import contextlib
import importlib.util
import inspect
import io
import json
import sys


def parse_args(text):
    stripped = text.strip()
    if not stripped:
        return []
    try:
        return list(ast.literal_eval("(" + stripped + ",)"))
    except (ValueError, SyntaxError, TypeError, MemoryError, RecursionError):
        return [text.rstrip("\n")]


def render(value):
    if isinstance(value, (list, tuple, dict)):
        try:
            return json.dumps(value)
        except (TypeError, ValueError):
            return str(value)
    return str(value)


def pick_target(module):
    functions = [
        obj for obj in vars(module).values()
        if inspect.isfunction(obj) and obj.__module__ == module.__name__
    ]
    if not functions:
        return None
    for fn in functions:
        if fn.__name__ == "main":
            return fn
    return max(functions, key=lambda fn: fn.__code__.co_firstlineno)


def positional_arity(fn):
    try:
        params = inspect.signature(fn).parameters.values()
    except (TypeError, ValueError):
        return -1
    return sum(1 for p in params
               if p.kind in (p.POSITIONAL_ONLY, p.POSITIONAL_OR_KEYWORD))


def main():
    path = sys.argv[1]
    raw = sys.stdin.read()
    sys.stdin = io.StringIO(raw)

    spec = importlib.util.spec_from_file_location("solution", path)
    module = importlib.util.module_from_spec(spec)
    sys.modules["solution"] = module

    loaded = io.StringIO()
    try:
        with contextlib.redirect_stdout(loaded):
            spec.loader.exec_module(module)
    finally:
        sys.stdout.write(loaded.getvalue())
    if loaded.getvalue():
        return

    target = pick_target(module)
    if target is None:
        return

    called = io.StringIO()
    with contextlib.redirect_stdout(called):
        arity = positional_arity(target)
        if target.__name__ == "main" and arity == 1:
            result = target(raw)
        elif arity == 0:
            result = target()
        else:
            result = target(*parse_args(raw))

    if result is None:
        sys.stdout.write(called.getvalue())
    else:
        sys.stdout.write(render(result) + "\n")


if __name__ == "__main__":
    main()
)PY";

constexpr std::string_view kJavaScriptDriver = R"JS('use strict';
const fs = require('fs');
const util = require('util');
const vm = require('vm');

function parseArgs(text) {
  const trimmed = text.trim();
  if (trimmed === '') return [];
  try {
    return JSON.parse('[' + trimmed + ']');
  } catch (e) {
    return [text.replace(/\n$/, '')];
  }
}

function render(value) {
  if (value !== null && typeof value === 'object') {
    try {
      return JSON.stringify(value);
    } catch (e) {
      return String(value);
    }
  }
  return String(value);
}

function functionNames(source) {
  const patterns = [
    /^[ \t]*(?:export\s+)?(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)\s*\(/gm,
    /^[ \t]*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s*)?(?:function\b|\([^)]*\)\s*=>|[A-Za-z_$][\w$]*\s*=>)/gm,
  ];
  const found = [];
  for (const pattern of patterns) {
    let match;
    while ((match = pattern.exec(source)) !== null) {
      found.push({ name: match[1], index: match.index });
    }
  }
  found.sort((a, b) => a.index - b.index);
  return found.map((f) => f.name);
}

async function main() {
  const file = process.argv[2];
  const source = fs.readFileSync(file, 'utf8');
  const raw = fs.readFileSync(0, 'utf8');

  let out = '';
  const write = (...args) => { out += util.format(...args) + '\n'; };
  const writeErr = (...args) => { process.stderr.write(util.format(...args) + '\n'); };
  const sandboxConsole = { log: write, info: write, debug: write, warn: writeErr, error: writeErr };

  const moduleObject = { exports: {} };
  const context = vm.createContext({
    console: sandboxConsole,
    module: moduleObject,
    exports: moduleObject.exports,
    require,
    process,
    Buffer,
    setTimeout, clearTimeout, setInterval, clearInterval, setImmediate,
  });

  vm.runInContext(source, context, { filename: file });
  if (out !== '') {
    process.stdout.write(out);
    return;
  }

  const candidates = [];
  for (const name of functionNames(source)) {
    const fn = vm.runInContext(`typeof ${name} === 'function' ? ${name} : undefined`, context);
    if (fn) candidates.push({ name, fn });
  }
  const exported = moduleObject.exports;
  if (typeof exported === 'function') {
    candidates.push({ name: exported.name, fn: exported });
  } else if (exported && typeof exported === 'object') {
    for (const [name, value] of Object.entries(exported)) {
      if (typeof value === 'function') candidates.push({ name, fn: value });
    }
  }
  if (candidates.length === 0) return;

  const target = candidates.find((c) => c.name === 'main') || candidates[candidates.length - 1];
  let result;
  if (target.name === 'main' && target.fn.length === 1) {
    result = target.fn(raw);
  } else if (target.fn.length === 0) {
    result = target.fn();
  } else {
    result = target.fn(...parseArgs(raw));
  }
  if (result && typeof result.then === 'function') result = await result;

  if (result === undefined) {
    process.stdout.write(out);
  } else {
    process.stdout.write(render(result) + '\n');
  }
}

main().catch((err) => {
  process.stderr.write((err && err.stack ? err.stack : String(err)) + '\n');
  process.exitCode = 1;
});
)JS";

}  // anonymous namespace

std::string_view python_driver_source() noexcept { return kPythonDriver; }
std::string_view javascript_driver_source() noexcept { return kJavaScriptDriver; }

}  // namespace sandbox_gate
