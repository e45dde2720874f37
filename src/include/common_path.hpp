#pragma once

// Common path
#define ROOT									"/opt/attendface/"
#define ASSERT									ROOT "assert/"


// Detector related paths
#define DETECTOR_PATH							ASSERT "detector/"
#define FACEDETECTOR							DETECTOR_PATH "haarcascade_frontalface_default.xml"

#define YNMODEL_PATH							ASSERT "models/face/"
#define YNMODEL									"face_detection_yunet_2023mar.onnx"


// Embedding related paths
#define SFACE_RECOGNIZER_PATH					ASSERT "models/face/"
#define SFACE_RECOGNIZER						"face_recognition_sface_2021dec.onnx"


// Config
#define CONFIG_PATH								ROOT "config/"
#define CONFIG_FILE								"attendface.json"


// Logs
#define LOG_DIR									ROOT "logs"
#define LOG_FILE_NAME							"attendface.log"
#define ERROR_LOG_FILE_NAME						"error.log"


// Sqlite DB
#define DB_PATH                            		ASSERT "db/"
#define DB                                  	"biometric.db"
