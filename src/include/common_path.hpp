#pragma once

// Common path
#define ROOT									"/var/lib/speaker_identity/"

// Sqlite DB
#define DB_PATH									ROOT "db/"
#define DB										"speakers.db"

// Config
#define CONFIG_PATH								ROOT "config/"
#define CONFIG_JSON								"speaker_identity.json"
