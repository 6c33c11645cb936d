// tagc.cpp - IR emitter: declaration pass, body pass, verification and optional passes
#include "tagc/ir_emitter.hpp"
#include "tagc/diagnostics_json.hpp"
#include "tagc/ir/builder.hpp"
#include "tagc/ir/collect.hpp"
#include "tagc/ir/runtime_decls.hpp"
#include "tagc/ir/types.hpp"
#include "tagc/ir/pass_pipeline.hpp"
#include "tagc/ir/scope_ops.hpp"
#include "tagc/ir/core_ops.hpp"
#include "tagc/ir/call_ops.hpp"
#include "tagc/ir/return_ops.hpp"
#include "tagc/ir/control_ops.hpp"
#include "tagc/ir/value_ops.hpp"
#include "tagc/ir/list_ops.hpp"
#include "tagc/ir/record_ops.hpp"
#include "tagc/ir/enum_ops.hpp"

#include <llvm/IR/IRBuilder.h>
#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>
#include <cstdio>

namespace tagc
{

// LLVM fatal error handler (signature matches install_fatal_error_handler requirement)
static void tagcFatalHandler(void *userData, const char *reason, bool genCrashDiag) {
	(void)userData; (void)genCrashDiag;
	fprintf(stderr, "[fatal][llvm] %s\n", reason ? reason : "<null reason>");
	llvm::sys::PrintStackTrace(llvm::errs());
	fprintf(stderr, "[fatal][llvm] end stack trace\n");
}

static void installFatalHandlerIfRequested(const EmitEnv &env) {
	static bool installed = false;
	if(installed || !env.installFatalHandler) return;
	llvm::install_fatal_error_handler(tagcFatalHandler);
	llvm::EnablePrettyStackTrace();
	llvm::sys::AddSignalHandler([](void*){
		fprintf(stderr, "[fatal][signal] caught fatal signal, printing stack trace...\n");
		llvm::sys::PrintStackTrace(llvm::errs());
	}, nullptr);
	installed = true;
	fprintf(stderr, "[diag] Installed LLVM fatal error handler (TAGC_INSTALL_FATAL_HANDLER=1)\n");
}

namespace {

struct FunctionDecl {
	std::string name;
	TypeId ret;
	std::vector<std::pair<std::string, TypeId>> params;
	node_ptr body; // null for :external
};

FunctionDecl read_header(TypeContext &tctx, const node_ptr &fn) {
	auto &l = std::get<list>(fn->data);
	FunctionDecl d;
	d.name = name_of(kw_arg(l, "name"));
	d.ret = tctx.get_base(BaseType::Void);
	try {
		if (auto ret = kw_arg(l, "ret")) d.ret = tctx.parse_type(ret);
		if (auto ps = kw_arg(l, "params"))
			for (auto &p : std::get<vector_t>(ps->data).elems) {
				auto &pl = std::get<list>(p->data).elems;
				d.params.emplace_back(ir::builder::var_name(pl[2]), tctx.parse_type(pl[1]));
			}
	} catch (const type_error &e) {
		throw ir::codegen_error("function '" + d.name + "': " + e.what());
	}
	bool external = false;
	if (auto ext = kw_arg(l, "external")) if (auto b = std::get_if<bool>(&ext->data)) external = *b;
	if (!external) d.body = kw_arg(l, "body");
	return d;
}

} // namespace

	IREmitter::IREmitter(TypeContext &tctx) : tctx_(tctx), env_(detectEnv()) { llctx_ = std::make_unique<llvm::LLVMContext>(); }
	IREmitter::~IREmitter() = default;

	llvm::Module *IREmitter::emit(const node_ptr &module_ast, TypeCheckResult &tc_result)
	{
		installFatalHandlerIfRequested(env_);
		TypeChecker checker(tctx_);
		tc_result = checker.check_module(module_ast);
		maybe_print_json(tc_result);
		if (!tc_result.success)
			return nullptr;
		return compile_program(module_ast);
	}

	llvm::Module *IREmitter::compile_program(const node_ptr &annotated)
	{
		if (!annotated || head_of(*annotated) != "module")
			throw ir::codegen_error("expected (module ...)");
		if (!llctx_) llctx_ = std::make_unique<llvm::LLVMContext>();
		module_ = std::make_unique<llvm::Module>("tagc.module", *llctx_);
		applyEnvToModule(*module_, env_);
		auto &top = std::get<list>(annotated->data).elems;

		// Pass 1: runtime, layouts and every function signature, so calls resolve regardless of order.
		const ir::RuntimeFunctions rt = ir::declare_runtime(*module_);
		const ir::collect::Layouts layouts = ir::collect::run(top, tctx_);
		std::vector<std::pair<llvm::Function *, FunctionDecl>> bodies;
		for (size_t i = 1; i < top.size(); ++i)
		{
			if (!top[i] || head_of(*top[i]) != "fn")
				continue;
			FunctionDecl d = read_header(tctx_, top[i]);
			std::vector<llvm::Type *> ptys;
			for (auto &p : d.params) ptys.push_back(ir::types::map_type(*llctx_, tctx_, p.second));
			auto *fty = llvm::FunctionType::get(ir::types::map_type(*llctx_, tctx_, d.ret), ptys, false);
			auto *F = llvm::Function::Create(fty, llvm::Function::ExternalLinkage, d.name, module_.get());
			for (size_t k = 0; k < d.params.size(); ++k) F->getArg((unsigned)k)->setName(d.params[k].first);
			if (d.body) bodies.emplace_back(F, std::move(d));
		}

		// Pass 2: bodies.
		llvm::IRBuilder<> irb(*llctx_);
		for (auto &fb : bodies)
		{
			llvm::Function *F = fb.first;
			const FunctionDecl &d = fb.second;
			irb.SetInsertPoint(llvm::BasicBlock::Create(*llctx_, "entry", F));
			ir::builder::State S{irb, *llctx_, *module_, tctx_, rt, layouts.structs, layouts.enums, env_};
			S.fn = F;
			for (size_t k = 0; k < d.params.size(); ++k)
			{
				S.vmap[d.params[k].first] = F->getArg((unsigned)k);
				S.vtypes[d.params[k].first] = d.params[k].second;
			}
			ir::builder::trace(S, "fn", d.name);

			std::function<void(const std::vector<node_ptr> &)> emit_list = [&](const std::vector<node_ptr> &insts)
			{
				for (auto &inst : insts)
				{
					if (ir::builder::terminated(S))
						return; // rest is unreachable (W1400 from the checker)
					if (!inst || head_of(*inst).empty())
						throw ir::codegen_error("instruction must be a list starting with an opcode");
					auto &il = std::get<list>(inst->data).elems;
					if (ir::core_ops::handle_literal(S, il, inst)) continue;
					if (ir::core_ops::handle_arith(S, il)) continue;
					if (ir::core_ops::handle_compare(S, il)) continue;
					if (ir::core_ops::handle_binding(S, il, inst)) continue;
					if (ir::core_ops::handle_print(S, il)) continue;
					if (ir::core_ops::handle_panic(S, il)) continue;
					if (ir::call_ops::handle(S, il, inst)) continue;
					if (ir::return_ops::handle(S, il, inst)) continue;
					if (ir::control_ops::handle(S, il, inst)) continue;
					if (ir::value_ops::handle(S, il, inst)) continue;
					if (ir::list_ops::handle(S, il, inst)) continue;
					if (ir::record_ops::handle(S, il, inst)) continue;
					if (ir::enum_ops::handle_enum_new(S, il, inst)) continue;
					if (ir::enum_ops::handle_match(S, il, inst)) continue;
					throw ir::codegen_error("unknown instruction '" + head_of(*inst) + "'");
				}
			};
			S.emit_scope = [&](const node_ptr &vec) { ir::scope_ops::emit_scope(S, vec, emit_list); };

			S.emit_scope(d.body);
			if (!ir::builder::terminated(S))
			{
				if (F->getReturnType()->isVoidTy()) irb.CreateRetVoid();
				else irb.CreateUnreachable();
			}
		}

		if (!ir::pass_pipeline::run_pass_pipeline(*module_, env_))
			return nullptr;
		return module_.get();
	}

	llvm::orc::ThreadSafeModule IREmitter::toThreadSafeModule() { return llvm::orc::ThreadSafeModule(std::move(module_), std::move(llctx_)); }

} // namespace tagc
