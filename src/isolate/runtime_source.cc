#include "runtime_source.h"

namespace jsbox {

const char* const kRuntimeSourceName = "jsbox:runtime";

const char* const kRuntimeSource = R"JSBOX((function (host, collectGarbage) {
	'use strict';
	const global = globalThis;
	const evaluateGlobal = eval;
	const hostExports = Object.create(null);

	// Output
	const format = (value) => {
		if (typeof value === 'string') {
			return value;
		}
		if (value instanceof Error) {
			return value.stack || String(value);
		}
		try {
			const text = JSON.stringify(value);
			return text === undefined ? String(value) : text;
		} catch (err) {
			return String(value);
		}
	};
	const print = (...args) => { host('Print', args.map(format).join(' ')); };
	const log = (...args) => { host('Print', args.map(format).join(' ') + '\n'); };
	Object.defineProperty(global, 'print', { value: print, writable: true, configurable: true });
	Object.defineProperty(global, 'console', {
		value: Object.freeze({ log, info: log, warn: log, error: log, debug: log, trace: log }),
		writable: true,
		configurable: true,
	});

	// Clock
	Date.now = () => Math.floor(Number(host('CurrentTimeMicros')) / 1000);

	// Modules
	const hostModules = Object.create(null);
	const moduleCache = Object.create(null);

	const dirname = (path) => {
		const index = path.lastIndexOf('/');
		return index < 0 ? '.' : index === 0 ? '/' : path.slice(0, index);
	};

	const interopDefault = (module) => module && module.__esModule ? module.default : module;

	const bindings = (list, source) => list.split(',').map((part) => part.trim()).filter(Boolean).map((part) => {
		const pieces = part.split(/\s+as\s+/);
		return pieces.length === 2 ? `${source(pieces[0])}: ${pieces[1]}` : source(pieces[0]);
	});

	// Rewrites the supported subset of `import` and `export` into the CommonJS wrapper below
	const lower = (source) => {
		let isModule = false;
		const trailer = [];
		const mark = (text) => { isModule = true; return text; };
		let lowered = source
			.replace(/^([ \t]*)import\s+([\w$]+)\s*,\s*\{([^}]*)\}\s*from\s*(['"])([^'"]+)\4\s*;?/gm,
				(_, indent, name, list, __, from) => mark(`${indent}const ${name} = __jsbox_default(require('${from}')), { ${bindings(list, (id) => id).join(', ')} } = require('${from}');`))
			.replace(/^([ \t]*)import\s+\*\s+as\s+([\w$]+)\s+from\s*(['"])([^'"]+)\3\s*;?/gm,
				(_, indent, name, __, from) => mark(`${indent}const ${name} = require('${from}');`))
			.replace(/^([ \t]*)import\s+\{([^}]*)\}\s*from\s*(['"])([^'"]+)\3\s*;?/gm,
				(_, indent, list, __, from) => mark(`${indent}const { ${bindings(list, (id) => id).join(', ')} } = require('${from}');`))
			.replace(/^([ \t]*)import\s+([\w$]+)\s+from\s*(['"])([^'"]+)\3\s*;?/gm,
				(_, indent, name, __, from) => mark(`${indent}const ${name} = __jsbox_default(require('${from}'));`))
			.replace(/^([ \t]*)import\s*(['"])([^'"]+)\2\s*;?/gm,
				(_, indent, __, from) => mark(`${indent}require('${from}');`))
			.replace(/^([ \t]*)export\s+\{([^}]*)\}\s*from\s*(['"])([^'"]+)\3\s*;?/gm,
				(_, indent, list, __, from) => mark(`${indent}{ const __jsbox_reexport = require('${from}'); ${
					list.split(',').map((part) => part.trim()).filter(Boolean).map((part) => {
						const pieces = part.split(/\s+as\s+/);
						return `exports.${pieces[pieces.length - 1]} = __jsbox_reexport.${pieces[0]};`;
					}).join(' ')} }`))
			.replace(/^([ \t]*)export\s+\{([^}]*)\}\s*;?/gm,
				(_, indent, list) => mark(indent + list.split(',').map((part) => part.trim()).filter(Boolean).map((part) => {
					const pieces = part.split(/\s+as\s+/);
					return `exports.${pieces[pieces.length - 1]} = ${pieces[0]};`;
				}).join(' ')))
			.replace(/^([ \t]*)export\s+default\s+/gm,
				(_, indent) => mark(`${indent}exports.default = `))
			.replace(/^([ \t]*)export\s+((?:async\s+)?function\*?|class|const|let|var)\s+([\w$]+)/gm,
				(_, indent, kind, name) => { trailer.push(`exports.${name} = ${name};`); return mark(`${indent}${kind} ${name}`); });
		if (isModule) {
			lowered = 'Object.defineProperty(exports, "__esModule", { value: true });' + lowered + '\n' + trailer.join('\n');
		}
		return lowered;
	};

	const evaluate = (path, source) => {
		const module = { exports: {} };
		moduleCache[path] = module;
		try {
			const wrapper = evaluateGlobal(
				'(function (exports, require, module, __filename, __dirname, __jsbox_default) {' +
				lower(source) +
				`\n})\n//# sourceURL=${path}`);
			const directory = dirname(path);
			wrapper.call(module.exports, module.exports, makeRequire(directory), module, path, directory, interopDefault);
		} catch (err) {
			delete moduleCache[path];
			throw err;
		}
		return module.exports;
	};

	const makeRequire = (directory) => (name) => {
		if (typeof name !== 'string' || name === '') {
			throw new TypeError('Module name must be a non-empty string');
		}
		if (name in hostModules) {
			return hostModules[name];
		}
		let path;
		try {
			path = String(host('ResolveModule', directory, name)).replace(/\\/g, '/');
		} catch (err) {
			throw new Error(`Cannot find module '${name}' from '${directory}'`);
		}
		if (path in moduleCache) {
			return moduleCache[path].exports;
		}
		let source;
		try {
			source = String(host('LoadModule', path));
		} catch (err) {
			throw new Error(`Error loading module '${path}'`);
		}
		return evaluate(path, source);
	};
	Object.defineProperty(global, 'require', { value: makeRequire('.'), writable: true, configurable: true });

	hostExports.RegisterHostModules = (manifest) => {
		const modules = JSON.parse(manifest);
		for (const moduleName of Object.keys(modules)) {
			const module = Object.create(null);
			for (const functionName of modules[moduleName]) {
				module[functionName] = (...args) =>
					JSON.parse(host('CallHostJsFunction', moduleName, functionName, JSON.stringify(args)));
			}
			hostModules[moduleName] = Object.freeze(module);
		}
	};

	// Handlers
	const handlers = Object.create(null);

	const makeHandlerPath = (name, directory) => {
		let path = (directory === undefined || directory === null || directory === '' ? '.' : directory).replace(/\\/g, '/');
		if (!path.endsWith('/')) {
			path += '/';
		}
		path += (name === '' ? 'handler' : name).replace(/\\/g, '/');
		if (!path.endsWith('.js') && !path.endsWith('.mjs')) {
			path += '.js';
		}
		return path;
	};

	hostExports.RegisterHandler = (name, source, directory) => {
		const text = source.includes('export') ? source : `${source}\nexport { handler };`;
		const exported = evaluate(makeHandlerPath(name, directory), text);
		if (typeof exported.handler !== 'function') {
			throw new TypeError(`Handler script for function ${name} does not export a function named 'handler'`);
		}
		handlers[name] = exported.handler;
	};

	hostExports.HandleEvent = (name, event, gc) => {
		const handler = handlers[name];
		if (handler === undefined) {
			throw new Error(`No handler registered for function ${name}`);
		}
		const finish = (result) => {
			const text = JSON.stringify(result);
			if (text === undefined) {
				throw new Error('The handler function did not return a value');
			}
			return text;
		};
		try {
			const result = handler(JSON.parse(event));
			if (result !== null && typeof result === 'object' && typeof result.then === 'function') {
				return Promise.resolve(result).then(finish);
			}
			return finish(result);
		} finally {
			if (gc) {
				collectGarbage();
			}
		}
	};

	return hostExports;
}))JSBOX";

} // namespace jsbox
