#ifndef BREACH_REGISTER_TYPES_H
#define BREACH_REGISTER_TYPES_H

#include <gdextension_interface.h>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/core/defs.hpp>
#include <godot_cpp/godot.hpp>

void initialize_breach_module(godot::ModuleInitializationLevel p_level);
void uninitialize_breach_module(godot::ModuleInitializationLevel p_level);

#endif // BREACH_REGISTER_TYPES_H
