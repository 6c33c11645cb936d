#include "tagc/ir/types.hpp"

namespace tagc::ir::types {

llvm::StructType* value_type(llvm::LLVMContext& C){
    if(auto* ST = llvm::StructType::getTypeByName(C, "tagc.value")) return ST;
    return llvm::StructType::create(C, {llvm::Type::getInt32Ty(C), llvm::Type::getInt64Ty(C)}, "tagc.value");
}

llvm::PointerType* handle_type(llvm::LLVMContext& C){ return llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(C)); }

llvm::Type* map_type(llvm::LLVMContext& C, const TypeContext& tctx, TypeId id){
    const Type& T = tctx.at(id);
    switch(T.kind){
    case Type::Kind::Base:
        switch(T.base){
        case BaseType::Bool: return llvm::Type::getInt1Ty(C);
        case BaseType::I64: return llvm::Type::getInt64Ty(C);
        case BaseType::F64: return llvm::Type::getDoubleTy(C);
        case BaseType::Null: return llvm::Type::getInt8Ty(C);
        case BaseType::Void: return llvm::Type::getVoidTy(C);
        }
        break;
    case Type::Kind::Value: return value_type(C);
    case Type::Kind::String:
    case Type::Kind::List:
    case Type::Kind::Tuple:
    case Type::Kind::Struct:
    case Type::Kind::Enum:
        return handle_type(C);
    }
    throw type_error("type " + tctx.to_string(id) + " has no value representation");
}

} // namespace tagc::ir::types
